/*
 * Live VOD Archiver - App Module
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <cstdio>
#include <memory>

#include <LiveVodArchiver/Acquisition/AcquisitionPlanner.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>

#include "ArchiverConfig.hpp"
#include "CommandLine.hpp"

namespace LiveVodArchiver::App {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitNotReady = 2;
inline constexpr int kExitUsage = 64;

int exitCodeFor(Acquisition::PollOutcome outcome) noexcept;

/**
 * Wires the production collaborators together and runs a single poll.
 * The outcome name is written to `out`.
 */
int runPoll(const ArchiverConfig &config, std::shared_ptr<const Logger::ILogger> logger, std::FILE *out = stdout);

int runCheckReady(const CommandLineOptions &options, std::shared_ptr<const Logger::ILogger> logger,
		  std::FILE *out = stdout);

int runSlice(const CommandLineOptions &options, std::shared_ptr<const Logger::ILogger> logger,
	     std::FILE *out = stdout);

} // namespace LiveVodArchiver::App
