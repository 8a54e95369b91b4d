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

#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ArchiverConfig.hpp"

namespace LiveVodArchiver::App {

class UsageError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

enum class CommandMode {
	Poll,
	CheckReady,
	Slice,
	Help,
};

struct CommandLineOptions {
	CommandMode mode = CommandMode::Poll;

	std::optional<std::filesystem::path> configPath;
	std::optional<std::string> channelTarget;
	std::optional<std::string> memoryFilePath;
	std::optional<int> chunkSizeMinutes;
	std::optional<std::string> downloadDir;
	std::optional<std::string> cookiesPath;
	std::optional<std::string> streamFormat;
	bool download = false;
	bool verbose = false;

	std::string manifestUrl;
	int startMinute = 0;
	std::optional<int> durationMinute;
};

/**
 * @throws UsageError on unknown flags, missing values or malformed numbers.
 */
CommandLineOptions parseCommandLine(std::span<const std::string_view> args);

void applyOverrides(const CommandLineOptions &options, ArchiverConfig &config);

std::string usageText();

} // namespace LiveVodArchiver::App
