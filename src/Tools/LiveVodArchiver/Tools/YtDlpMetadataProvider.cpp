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

#include "YtDlpMetadataProvider.hpp"

#include <ctime>
#include <stdexcept>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <LiveVodArchiver/Acquisition/AcquisitionErrors.hpp>

namespace LiveVodArchiver::Tools {

using Acquisition::DiscoveryError;
using Acquisition::RecordingIdentity;

namespace {

std::optional<std::string> stringField(const nlohmann::json &j, const char *key)
{
	if (j.contains(key) && j.at(key).is_string()) {
		std::string value = j.at(key).get<std::string>();
		if (!value.empty())
			return value;
	}
	return std::nullopt;
}

std::optional<double> numberField(const nlohmann::json &j, const char *key)
{
	if (j.contains(key) && j.at(key).is_number()) {
		return j.at(key).get<double>();
	}
	return std::nullopt;
}

} // anonymous namespace

YtDlpMetadataProvider::YtDlpMetadataProvider(std::shared_ptr<IProcessRunner> runner, YtDlpOptions options)
	: runner_(std::move(runner)),
	  options_(std::move(options))
{
	if (!runner_) {
		throw std::invalid_argument("RunnerIsNullError(YtDlpMetadataProvider::YtDlpMetadataProvider)");
	}
	if (options_.executable.empty()) {
		throw std::invalid_argument("ExecutableIsEmptyError(YtDlpMetadataProvider::YtDlpMetadataProvider)");
	}
}

YtDlpMetadataProvider::~YtDlpMetadataProvider() noexcept = default;

std::string YtDlpMetadataProvider::channelVideosUrl(std::string_view channelTarget)
{
	std::string target(channelTarget);
	if (target.ends_with("/videos")) {
		return target;
	}
	while (!target.empty() && target.back() == '/') {
		target.pop_back();
	}
	return target + "/videos?filter=archives&sort=time";
}

std::string YtDlpMetadataProvider::recordingTitle(std::string_view uploader, double createdAtTimestamp)
{
	const auto seconds = static_cast<std::time_t>(createdAtTimestamp);
	return fmt::format("Twitch_VOD_{}_{:%Y-%m-%dT%H_%M_%S}", uploader.empty() ? "Unknown" : uploader,
			   fmt::localtime(seconds));
}

std::optional<RecordingIdentity> YtDlpMetadataProvider::identityFromInfo(const nlohmann::json &info)
{
	if (!info.is_object()) {
		return std::nullopt;
	}

	const std::optional<double> timestamp = numberField(info, "timestamp");
	if (!timestamp) {
		return std::nullopt;
	}

	std::optional<std::string> sourceUrl = stringField(info, "webpage_url");
	if (!sourceUrl)
		sourceUrl = stringField(info, "url");
	if (!sourceUrl) {
		return std::nullopt;
	}

	RecordingIdentity identity;
	identity.sourceUrl = std::move(*sourceUrl);
	identity.createdAtTimestamp = *timestamp;

	if (std::optional<double> duration = numberField(info, "duration"); duration && *duration > 0.0) {
		identity.totalDurationSeconds = *duration;
	}

	identity.uploader = stringField(info, "uploader").value_or("Unknown");
	identity.title = recordingTitle(identity.uploader, identity.createdAtTimestamp);

	return identity;
}

std::vector<std::string> YtDlpMetadataProvider::baseCommand() const
{
	std::vector<std::string> argv{options_.executable, "--quiet", "--no-warnings"};
	if (!options_.cookiesPath.empty()) {
		argv.push_back("--cookies");
		argv.push_back(options_.cookiesPath);
	}
	return argv;
}

nlohmann::json YtDlpMetadataProvider::runJson(std::vector<std::string> argv, std::string_view context)
{
	ProcessResult result;
	try {
		result = runner_->run(argv);
	} catch (const std::runtime_error &e) {
		throw DiscoveryError(fmt::format("DiscoveryError(YtDlpMetadataProvider::{}):{}", context, e.what()));
	}

	if (!result.succeeded()) {
		logger_->error("YtDlpExitError",
			       {{"context", context}, {"exitStatus", std::to_string(result.exitStatus)}});
		throw DiscoveryError(fmt::format("DiscoveryError(YtDlpMetadataProvider::{}):exit {}", context,
						 result.exitStatus));
	}

	nlohmann::json j = nlohmann::json::parse(result.stdoutText, nullptr, false);
	if (j.is_discarded()) {
		logger_->error("YtDlpOutputParseError", {{"context", context}});
		throw DiscoveryError(fmt::format("DiscoveryError(YtDlpMetadataProvider::{}):InvalidJson", context));
	}
	return j;
}

std::optional<RecordingIdentity> YtDlpMetadataProvider::discoverLatest(const std::string &channelTarget)
{
	const std::string targetUrl = channelVideosUrl(channelTarget);
	logger_->info("CheckingLatestRecording", {{"url", targetUrl}});

	std::vector<std::string> argv = baseCommand();
	argv.insert(argv.end(), {"--flat-playlist", "--playlist-end", "1", "-J", targetUrl});
	nlohmann::json info = runJson(std::move(argv), "discoverLatest");

	nlohmann::json entry;
	if (info.contains("entries") && info.at("entries").is_array()) {
		const auto &entries = info.at("entries");
		if (entries.empty()) {
			logger_->info("NoRecordingsFound", {{"url", targetUrl}});
			return std::nullopt;
		}
		entry = entries.front();
	} else {
		entry = std::move(info);
	}

	if (!numberField(entry, "timestamp")) {
		std::optional<std::string> entryUrl = stringField(entry, "url");
		if (!entryUrl)
			entryUrl = stringField(entry, "webpage_url");

		if (entryUrl) {
			std::vector<std::string> detailArgv = baseCommand();
			detailArgv.insert(detailArgv.end(), {"-J", *entryUrl});
			try {
				entry = runJson(std::move(detailArgv), "discoverLatest");
			} catch (const DiscoveryError &e) {
				logger_->warn("RecordingDetailUnavailable", {{"url", *entryUrl}, {"exception", e.what()}});
			}
		}
	}

	std::optional<RecordingIdentity> identity = identityFromInfo(entry);
	if (!identity) {
		logger_->warn("RecordingTimestampUnknown", {{"url", targetUrl}});
		return std::nullopt;
	}

	logger_->info("LatestRecordingFound",
		      {{"title", identity->title},
		       {"sourceUrl", identity->sourceUrl},
		       {"durationSeconds",
			identity->totalDurationSeconds ? fmt::format("{}", *identity->totalDurationSeconds) : "live"}});
	return identity;
}

std::string YtDlpMetadataProvider::resolveManifestUrl(const RecordingIdentity &identity)
{
	std::vector<std::string> argv = baseCommand();
	argv.insert(argv.end(), {"-f", options_.streamFormat, "-g", identity.sourceUrl});

	ProcessResult result;
	try {
		result = runner_->run(argv);
	} catch (const std::runtime_error &e) {
		throw DiscoveryError(fmt::format("DiscoveryError(YtDlpMetadataProvider::resolveManifestUrl):{}", e.what()));
	}

	if (!result.succeeded()) {
		logger_->error("YtDlpExitError", {{"context", "resolveManifestUrl"},
						  {"exitStatus", std::to_string(result.exitStatus)}});
		throw DiscoveryError(fmt::format("DiscoveryError(YtDlpMetadataProvider::resolveManifestUrl):exit {}",
						 result.exitStatus));
	}

	std::string_view output = result.stdoutText;
	while (!output.empty()) {
		const auto newline = output.find('\n');
		std::string_view line = output.substr(0, newline);
		while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
			line.remove_suffix(1);
		}
		if (!line.empty()) {
			logger_->info("ManifestUrlResolved", {{"sourceUrl", identity.sourceUrl}});
			return std::string(line);
		}
		if (newline == std::string_view::npos) {
			break;
		}
		output.remove_prefix(newline + 1);
	}

	logger_->error("ManifestUrlEmpty", {{"sourceUrl", identity.sourceUrl}});
	throw DiscoveryError("DiscoveryError(YtDlpMetadataProvider::resolveManifestUrl):EmptyOutput");
}

} // namespace LiveVodArchiver::Tools
