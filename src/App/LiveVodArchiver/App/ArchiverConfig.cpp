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

#include "ArchiverConfig.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace LiveVodArchiver::App {

void from_json(const nlohmann::json &j, ArchiverConfig &p)
{
	if (j.contains("channelTarget"))
		j.at("channelTarget").get_to(p.acquisition.channelTarget);
	if (j.contains("memoryFilePath"))
		p.acquisition.memoryFilePath = j.at("memoryFilePath").get<std::string>();
	if (j.contains("chunkSizeMinutes"))
		j.at("chunkSizeMinutes").get_to(p.acquisition.chunkSizeMinutes);
	if (j.contains("dispatchEnabled"))
		j.at("dispatchEnabled").get_to(p.acquisition.dispatchEnabled);
	if (j.contains("sameRecordingToleranceSeconds"))
		j.at("sameRecordingToleranceSeconds").get_to(p.acquisition.sameRecordingToleranceSeconds);

	if (j.contains("downloadDir"))
		p.downloadDir = j.at("downloadDir").get<std::string>();
	if (j.contains("cookiesPath"))
		j.at("cookiesPath").get_to(p.cookiesPath);
	if (j.contains("streamFormat"))
		j.at("streamFormat").get_to(p.streamFormat);
	if (j.contains("ytDlpPath"))
		j.at("ytDlpPath").get_to(p.ytDlpPath);
	if (j.contains("ffmpegPath"))
		j.at("ffmpegPath").get_to(p.ffmpegPath);
	if (j.contains("logLevel"))
		j.at("logLevel").get_to(p.logLevel);
}

ArchiverConfig ArchiverConfig::load(const std::filesystem::path &path, const Logger::ILogger &logger)
{
	ArchiverConfig config;

	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec)) {
		logger.info("ConfigFileNotExist", {{"path", path.string()}});
		return config;
	}

	std::ifstream ifs(path, std::ios::in);
	if (!ifs.is_open()) {
		logger.warn("ConfigFileOpenError", {{"path", path.string()}});
		return config;
	}

	try {
		nlohmann::json j = nlohmann::json::parse(ifs);
		j.get_to(config);
		logger.info("ConfigLoaded", {{"path", path.string()}});
	} catch (const nlohmann::json::exception &e) {
		logger.warn("ConfigFileParseError", {{"path", path.string()}, {"exception", e.what()}});
		return ArchiverConfig{};
	}

	return config;
}

void ArchiverConfig::validate() const
{
	if (acquisition.channelTarget.empty()) {
		throw std::invalid_argument("ChannelTargetIsEmptyError(ArchiverConfig::validate)");
	}
	if (acquisition.chunkSizeMinutes <= 0) {
		throw std::invalid_argument("NonPositiveChunkSizeError(ArchiverConfig::validate)");
	}
	if (ytDlpPath.empty()) {
		throw std::invalid_argument("YtDlpPathIsEmptyError(ArchiverConfig::validate)");
	}
	if (ffmpegPath.empty()) {
		throw std::invalid_argument("FfmpegPathIsEmptyError(ArchiverConfig::validate)");
	}
}

} // namespace LiveVodArchiver::App
