/*
 * Live VOD Archiver - Acquisition Module
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
#include <string_view>

#include <LiveVodArchiver/Hls/HlsTypes.hpp>
#include <LiveVodArchiver/Hls/PlaylistFetcher.hpp>
#include <LiveVodArchiver/Hls/PlaylistParser.hpp>
#include <LiveVodArchiver/Hls/WindowSlicer.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "AcquisitionConfig.hpp"
#include "IChunkDownloader.hpp"
#include "IVideoMetadataProvider.hpp"
#include "ProgressStore.hpp"
#include "RecordingIdentity.hpp"

namespace LiveVodArchiver::Acquisition {

enum class PollOutcome {
	NewRecordingChunkDownloaded,
	ContinuedChunkDownloaded,
	ChunkNotReady,
	AllChunksDone,
	NoOp,
	DiscoveryFailed,
	ChunkDownloadFailed,
	NewRecordingAvailable,
};

std::string_view toString(PollOutcome outcome) noexcept;

enum class RecordingTransition {
	New,
	Same,
	Stale,
};

struct PollResult {
	PollOutcome outcome = PollOutcome::NoOp;
	std::optional<RecordingIdentity> identity;
	std::optional<int> targetChunkIndex;
	std::optional<Hls::TimeWindow> window;
	std::optional<Hls::ChunkManifest> manifest;
};

/**
 * Runs one poll: discovers the latest recording, decides which chunk window comes
 * next, slices it from the live playlist, hands it to the downloader and commits
 * progress only after the downloader succeeded.
 */
class AcquisitionPlanner {
public:
	AcquisitionPlanner(AcquisitionConfig config, std::shared_ptr<IVideoMetadataProvider> metadataProvider,
			   std::shared_ptr<Hls::IPlaylistFetcher> playlistFetcher,
			   std::shared_ptr<IChunkDownloader> downloader, std::shared_ptr<ProgressStore> progressStore);
	~AcquisitionPlanner() noexcept;

	AcquisitionPlanner(const AcquisitionPlanner &) = delete;
	AcquisitionPlanner &operator=(const AcquisitionPlanner &) = delete;
	AcquisitionPlanner(AcquisitionPlanner &&) = delete;
	AcquisitionPlanner &operator=(AcquisitionPlanner &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);

	/**
	 * @throws Hls::NetworkError when the playlist cannot be fetched; nothing is persisted.
	 */
	PollResult poll();

	static RecordingTransition classifyTransition(double createdAtTimestamp, double lastSeenTimestamp,
						      double toleranceSeconds) noexcept;

	static std::optional<int> estimateTotalChunks(std::optional<double> totalDurationSeconds,
						      int chunkSizeMinutes) noexcept;

	// Largest stored chunk count whose window minutes still fit in an int.
	static int maxChunkIndex(int chunkSizeMinutes) noexcept;

private:
	PollResult dispatchChunk(PollResult result, RecordingTransition transition, std::optional<int> estimatedTotalChunks);

	const AcquisitionConfig config_;
	std::shared_ptr<IVideoMetadataProvider> metadataProvider_;
	std::shared_ptr<Hls::IPlaylistFetcher> playlistFetcher_;
	std::shared_ptr<IChunkDownloader> downloader_;
	std::shared_ptr<ProgressStore> progressStore_;

	Hls::PlaylistParser parser_;
	Hls::WindowSlicer slicer_;

	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Acquisition
