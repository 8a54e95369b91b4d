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
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <LiveVodArchiver/Acquisition/AcquisitionConfig.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>

namespace LiveVodArchiver::App {

struct ArchiverConfig {
	// The command-line tool only reports new recordings until --download or dispatchEnabled asks for more.
	Acquisition::AcquisitionConfig acquisition{.dispatchEnabled = false};

	std::filesystem::path downloadDir = ".";
	std::string cookiesPath;
	std::string streamFormat = "bestvideo[height<=480]+bestaudio/best[height<=480]";
	std::string ytDlpPath = "yt-dlp";
	std::string ffmpegPath = "ffmpeg";
	std::string logLevel = "info";

	/**
	 * Reads a JSON config file. A missing or unreadable file yields the defaults.
	 */
	static ArchiverConfig load(const std::filesystem::path &path, const Logger::ILogger &logger);

	/**
	 * @throws std::invalid_argument when the channel target or a tool path is empty, or the chunk size is not
	 * positive.
	 */
	void validate() const;
};

void from_json(const nlohmann::json &j, ArchiverConfig &p);

} // namespace LiveVodArchiver::App
