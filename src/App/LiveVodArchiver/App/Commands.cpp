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

#include "Commands.hpp"

#include <optional>
#include <string>

#include <fmt/format.h>

#include <LiveVodArchiver/Acquisition/ProgressStore.hpp>
#include <LiveVodArchiver/CurlHelper/CurlEasyHandle.hpp>
#include <LiveVodArchiver/Hls/PlaylistFetcher.hpp>
#include <LiveVodArchiver/Hls/PlaylistParser.hpp>
#include <LiveVodArchiver/Hls/ReadinessClassifier.hpp>
#include <LiveVodArchiver/Hls/WindowSlicer.hpp>
#include <LiveVodArchiver/Tools/FfmpegChunkDownloader.hpp>
#include <LiveVodArchiver/Tools/ProcessRunner.hpp>
#include <LiveVodArchiver/Tools/YtDlpMetadataProvider.hpp>

namespace LiveVodArchiver::App {

namespace {

std::shared_ptr<Hls::CurlPlaylistFetcher> makeFetcher(const std::shared_ptr<const Logger::ILogger> &logger)
{
	auto fetcher = std::make_shared<Hls::CurlPlaylistFetcher>(std::make_shared<CurlHelper::CurlEasyHandle>());
	fetcher->setLogger(logger);
	return fetcher;
}

} // anonymous namespace

int exitCodeFor(Acquisition::PollOutcome outcome) noexcept
{
	switch (outcome) {
	case Acquisition::PollOutcome::DiscoveryFailed:
	case Acquisition::PollOutcome::ChunkDownloadFailed:
		return kExitFailure;
	default:
		return kExitOk;
	}
}

int runPoll(const ArchiverConfig &config, std::shared_ptr<const Logger::ILogger> logger, std::FILE *out)
{
	config.validate();

	auto runner = std::make_shared<Tools::PopenProcessRunner>();
	runner->setLogger(logger);

	auto metadataProvider = std::make_shared<Tools::YtDlpMetadataProvider>(
		runner, Tools::YtDlpOptions{config.ytDlpPath, config.cookiesPath, config.streamFormat});
	metadataProvider->setLogger(logger);

	auto downloader = std::make_shared<Tools::FfmpegChunkDownloader>(
		runner, Tools::FfmpegOptions{config.ffmpegPath, config.downloadDir});
	downloader->setLogger(logger);

	auto progressStore = std::make_shared<Acquisition::ProgressStore>();
	progressStore->setLogger(logger);

	Acquisition::AcquisitionPlanner planner(config.acquisition, metadataProvider, makeFetcher(logger),
						downloader, progressStore);
	planner.setLogger(logger);

	const Acquisition::PollResult result = planner.poll();

	const std::string_view name = Acquisition::toString(result.outcome);
	if (result.identity && result.targetChunkIndex) {
		fmt::print(out, "{}\t{}\tchunk={}\n", name, result.identity->title, *result.targetChunkIndex);
	} else if (result.identity) {
		fmt::print(out, "{}\t{}\n", name, result.identity->title);
	} else {
		fmt::print(out, "{}\n", name);
	}

	return exitCodeFor(result.outcome);
}

int runCheckReady(const CommandLineOptions &options, std::shared_ptr<const Logger::ILogger> logger, std::FILE *out)
{
	Hls::ReadinessClassifier classifier(makeFetcher(logger));
	classifier.setLogger(logger);

	const bool finalized = classifier.isFinalized(options.manifestUrl);
	fmt::print(out, "{}\n", finalized ? "ready" : "not-ready");
	return kExitOk;
}

int runSlice(const CommandLineOptions &options, std::shared_ptr<const Logger::ILogger> logger, std::FILE *out)
{
	auto fetcher = makeFetcher(logger);

	Hls::PlaylistParser parser;
	parser.setLogger(logger);
	Hls::WindowSlicer slicer;
	slicer.setLogger(logger);

	const std::string rawText = fetcher->fetch(options.manifestUrl);
	const Hls::ParsedPlaylist playlist = parser.parse(rawText);

	const Hls::TimeWindow window{options.startMinute, options.durationMinute};
	const std::optional<Hls::ChunkManifest> manifest =
		slicer.slice(playlist, window, Hls::WindowSlicer::baseUrlOf(options.manifestUrl));

	if (!manifest) {
		logger->info("SliceNotReady", {{"startMinute", fmt::format("{}", options.startMinute)},
					       {"totalSeconds", fmt::format("{:.3f}", playlist.totalDurationSeconds())}});
		return kExitNotReady;
	}

	fmt::print(out, "{}\n", manifest->text);
	return kExitOk;
}

} // namespace LiveVodArchiver::App
