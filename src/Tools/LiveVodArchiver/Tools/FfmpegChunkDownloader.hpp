/*
 * Live VOD Archiver - Tools Module
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
#include <memory>
#include <string>
#include <string_view>

#include <LiveVodArchiver/Acquisition/IChunkDownloader.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "ProcessRunner.hpp"

namespace LiveVodArchiver::Tools {

struct FfmpegOptions {
	std::string executable = "ffmpeg";
	std::filesystem::path downloadDir = ".";
};

/**
 * Writes the chunk manifest next to its output and remuxes the referenced segments
 * into <downloadDir>/<recording title>/chunk_NNN.mp4 without re-encoding.
 */
class FfmpegChunkDownloader final : public Acquisition::IChunkDownloader {
public:
	FfmpegChunkDownloader(std::shared_ptr<IProcessRunner> runner, FfmpegOptions options);
	~FfmpegChunkDownloader() noexcept override;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	bool dispatch(const std::string &manifestText, const Acquisition::ChunkDestination &destination) override;

	static std::string sanitizeFolderName(std::string_view title);

	static std::string chunkBaseName(int chunkIndex);

private:
	std::shared_ptr<IProcessRunner> runner_;
	const FfmpegOptions options_;

	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Tools
