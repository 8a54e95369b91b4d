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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <LiveVodArchiver/Acquisition/IVideoMetadataProvider.hpp>
#include <LiveVodArchiver/Acquisition/RecordingIdentity.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "ProcessRunner.hpp"

namespace LiveVodArchiver::Tools {

struct YtDlpOptions {
	std::string executable = "yt-dlp";
	std::string cookiesPath;
	std::string streamFormat = "bestvideo[height<=480]+bestaudio/best[height<=480]";
};

/**
 * Recording metadata and playlist URLs obtained from the yt-dlp command line tool.
 */
class YtDlpMetadataProvider final : public Acquisition::IVideoMetadataProvider {
public:
	YtDlpMetadataProvider(std::shared_ptr<IProcessRunner> runner, YtDlpOptions options);
	~YtDlpMetadataProvider() noexcept override;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	std::optional<Acquisition::RecordingIdentity> discoverLatest(const std::string &channelTarget) override;

	std::string resolveManifestUrl(const Acquisition::RecordingIdentity &identity) override;

	// Points a channel URL at its archived broadcasts, newest first.
	static std::string channelVideosUrl(std::string_view channelTarget);

	static std::optional<Acquisition::RecordingIdentity> identityFromInfo(const nlohmann::json &info);

	static std::string recordingTitle(std::string_view uploader, double createdAtTimestamp);

private:
	std::vector<std::string> baseCommand() const;
	nlohmann::json runJson(std::vector<std::string> argv, std::string_view context);

	std::shared_ptr<IProcessRunner> runner_;
	const YtDlpOptions options_;

	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Tools
