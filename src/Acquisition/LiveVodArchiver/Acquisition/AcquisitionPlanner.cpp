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

#include "AcquisitionPlanner.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <LiveVodArchiver/Hls/HlsErrors.hpp>
#include <LiveVodArchiver/Hls/ReadinessClassifier.hpp>

#include "AcquisitionErrors.hpp"

namespace LiveVodArchiver::Acquisition {

namespace {

std::string formatOptional(const std::optional<int> &value)
{
	return value ? std::to_string(*value) : std::string("unknown");
}

} // anonymous namespace

std::string_view toString(PollOutcome outcome) noexcept
{
	switch (outcome) {
	case PollOutcome::NewRecordingChunkDownloaded:
		return "NEW_RECORDING_CHUNK_DOWNLOADED";
	case PollOutcome::ContinuedChunkDownloaded:
		return "CONTINUED_CHUNK_DOWNLOADED";
	case PollOutcome::ChunkNotReady:
		return "CHUNK_NOT_READY";
	case PollOutcome::AllChunksDone:
		return "ALL_CHUNKS_DONE";
	case PollOutcome::NoOp:
		return "NO_OP";
	case PollOutcome::DiscoveryFailed:
		return "DISCOVERY_FAILED";
	case PollOutcome::ChunkDownloadFailed:
		return "CHUNK_DOWNLOAD_FAILED";
	case PollOutcome::NewRecordingAvailable:
		return "NEW_RECORDING_AVAILABLE";
	default:
		return "UNKNOWN";
	}
}

AcquisitionPlanner::AcquisitionPlanner(AcquisitionConfig config,
				       std::shared_ptr<IVideoMetadataProvider> metadataProvider,
				       std::shared_ptr<Hls::IPlaylistFetcher> playlistFetcher,
				       std::shared_ptr<IChunkDownloader> downloader,
				       std::shared_ptr<ProgressStore> progressStore)
	: config_(std::move(config)),
	  metadataProvider_(std::move(metadataProvider)),
	  playlistFetcher_(std::move(playlistFetcher)),
	  downloader_(std::move(downloader)),
	  progressStore_(std::move(progressStore))
{
	if (!metadataProvider_) {
		throw std::invalid_argument("MetadataProviderIsNullError(AcquisitionPlanner::AcquisitionPlanner)");
	}
	if (!playlistFetcher_) {
		throw std::invalid_argument("PlaylistFetcherIsNullError(AcquisitionPlanner::AcquisitionPlanner)");
	}
	if (!downloader_) {
		throw std::invalid_argument("DownloaderIsNullError(AcquisitionPlanner::AcquisitionPlanner)");
	}
	if (!progressStore_) {
		throw std::invalid_argument("ProgressStoreIsNullError(AcquisitionPlanner::AcquisitionPlanner)");
	}
	if (config_.channelTarget.empty()) {
		throw std::invalid_argument("ChannelTargetIsEmptyError(AcquisitionPlanner::AcquisitionPlanner)");
	}
	if (config_.chunkSizeMinutes <= 0) {
		throw std::invalid_argument("NonPositiveChunkSizeError(AcquisitionPlanner::AcquisitionPlanner)");
	}
}

AcquisitionPlanner::~AcquisitionPlanner() noexcept = default;

void AcquisitionPlanner::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = std::move(logger);
	parser_.setLogger(logger_);
	slicer_.setLogger(logger_);
}

RecordingTransition AcquisitionPlanner::classifyTransition(double createdAtTimestamp, double lastSeenTimestamp,
							   double toleranceSeconds) noexcept
{
	const double delta = createdAtTimestamp - lastSeenTimestamp;
	if (delta >= toleranceSeconds) {
		return RecordingTransition::New;
	}
	if (std::abs(delta) < toleranceSeconds) {
		return RecordingTransition::Same;
	}
	return RecordingTransition::Stale;
}

std::optional<int> AcquisitionPlanner::estimateTotalChunks(std::optional<double> totalDurationSeconds,
							   int chunkSizeMinutes) noexcept
{
	if (!totalDurationSeconds || *totalDurationSeconds <= 0.0 || chunkSizeMinutes <= 0) {
		return std::nullopt;
	}
	const double chunks = std::ceil(*totalDurationSeconds / 60.0 / static_cast<double>(chunkSizeMinutes));
	if (chunks > static_cast<double>(kMaxRecordedChunks)) {
		return std::nullopt;
	}
	return static_cast<int>(chunks);
}

int AcquisitionPlanner::maxChunkIndex(int chunkSizeMinutes) noexcept
{
	if (chunkSizeMinutes <= 0) {
		return 0;
	}
	// Both the start and the end minute of the chunk must fit in an int.
	return std::numeric_limits<int>::max() / chunkSizeMinutes - 1;
}

PollResult AcquisitionPlanner::poll()
{
	PollResult result;

	std::optional<RecordingIdentity> identity;
	try {
		identity = metadataProvider_->discoverLatest(config_.channelTarget);
	} catch (const DiscoveryError &e) {
		logger_->error("DiscoveryError", {{"channelTarget", config_.channelTarget}, {"exception", e.what()}});
		result.outcome = PollOutcome::DiscoveryFailed;
		return result;
	}

	if (!identity) {
		logger_->warn("NoRecordingFound", {{"channelTarget", config_.channelTarget}});
		result.outcome = PollOutcome::DiscoveryFailed;
		return result;
	}
	result.identity = identity;

	ProgressRecord record = progressStore_->load(config_.memoryFilePath);
	if (record.chunksAcquired > maxChunkIndex(config_.chunkSizeMinutes)) {
		// Unreachable chunk index for this chunk size; recover as from a corrupted state file.
		logger_->warn("ProgressOutOfRange", {{"chunksAcquired", std::to_string(record.chunksAcquired)},
						     {"chunkSizeMinutes", std::to_string(config_.chunkSizeMinutes)}});
		record = ProgressRecord{};
	}

	const RecordingTransition transition = classifyTransition(
		identity->createdAtTimestamp, record.lastSeenTimestamp, config_.sameRecordingToleranceSeconds);

	int effectiveChunksAcquired = 0;
	switch (transition) {
	case RecordingTransition::New:
		logger_->info("NewRecordingDetected", {{"title", identity->title},
						       {"sourceUrl", identity->sourceUrl},
						       {"createdAt", fmt::format("{}", identity->createdAtTimestamp)},
						       {"lastSeen", fmt::format("{}", record.lastSeenTimestamp)}});
		effectiveChunksAcquired = 0;
		break;
	case RecordingTransition::Same:
		logger_->info("CheckingCurrentRecording", {{"title", identity->title},
							   {"chunksAcquired", std::to_string(record.chunksAcquired)}});
		effectiveChunksAcquired = record.chunksAcquired;
		break;
	case RecordingTransition::Stale:
		logger_->info("StaleRecordingIgnored", {{"createdAt", fmt::format("{}", identity->createdAtTimestamp)},
							{"lastSeen", fmt::format("{}", record.lastSeenTimestamp)}});
		result.outcome = PollOutcome::NoOp;
		return result;
	}

	if (!config_.dispatchEnabled) {
		result.outcome = transition == RecordingTransition::New ? PollOutcome::NewRecordingAvailable
									: PollOutcome::NoOp;
		return result;
	}

	const int targetChunkIndex = effectiveChunksAcquired;
	const Hls::TimeWindow window{targetChunkIndex * config_.chunkSizeMinutes, config_.chunkSizeMinutes};
	result.targetChunkIndex = targetChunkIndex;
	result.window = window;

	const std::optional<int> estimatedTotalChunks =
		estimateTotalChunks(identity->totalDurationSeconds, config_.chunkSizeMinutes);
	logger_->info("ChunkPlanned", {{"chunkIndex", std::to_string(targetChunkIndex)},
				       {"startMinute", std::to_string(window.startMinute)},
				       {"durationMinute", std::to_string(config_.chunkSizeMinutes)},
				       {"estimatedTotalChunks", formatOptional(estimatedTotalChunks)}});

	std::string manifestUrl;
	try {
		manifestUrl = metadataProvider_->resolveManifestUrl(*identity);
	} catch (const DiscoveryError &e) {
		logger_->error("ManifestUrlResolveError", {{"sourceUrl", identity->sourceUrl}, {"exception", e.what()}});
		result.outcome = PollOutcome::DiscoveryFailed;
		return result;
	}

	const std::string rawText = playlistFetcher_->fetch(manifestUrl);

	if (Hls::ReadinessClassifier::containsEndList(rawText) && estimatedTotalChunks &&
	    *estimatedTotalChunks <= targetChunkIndex) {
		logger_->info("AllChunksDownloaded", {{"chunksAcquired", std::to_string(targetChunkIndex)},
						      {"estimatedTotalChunks", formatOptional(estimatedTotalChunks)}});
		result.outcome = PollOutcome::AllChunksDone;
		return result;
	}

	Hls::ParsedPlaylist playlist;
	try {
		playlist = parser_.parse(rawText);
	} catch (const Hls::MalformedPlaylistError &e) {
		logger_->warn("PlaylistNotUsable", {{"manifestUrl", manifestUrl}, {"exception", e.what()}});
		result.outcome = PollOutcome::ChunkNotReady;
		return result;
	}

	const std::string baseUrl = Hls::WindowSlicer::baseUrlOf(manifestUrl);
	result.manifest = slicer_.slice(playlist, window, baseUrl);

	if (!result.manifest && playlist.isFinalized) {
		// The recording ended inside this window; take whatever remains of it.
		const Hls::TimeWindow tailWindow{window.startMinute, std::nullopt};
		result.manifest = slicer_.slice(playlist, tailWindow, baseUrl);
		if (!result.manifest) {
			logger_->info("AllChunksDownloaded", {{"chunksAcquired", std::to_string(targetChunkIndex)},
							      {"estimatedTotalChunks", formatOptional(estimatedTotalChunks)}});
			result.outcome = PollOutcome::AllChunksDone;
			return result;
		}
		result.window = tailWindow;
		logger_->info("FinalChunkShortened",
			      {{"chunkIndex", std::to_string(targetChunkIndex)},
			       {"seconds", fmt::format("{:.3f}", result.manifest->durationSeconds)}});
	}

	if (!result.manifest) {
		logger_->info("ChunkNotReady", {{"chunkIndex", std::to_string(targetChunkIndex)}});
		result.outcome = PollOutcome::ChunkNotReady;
		return result;
	}

	return dispatchChunk(std::move(result), transition, estimatedTotalChunks);
}

PollResult AcquisitionPlanner::dispatchChunk(PollResult result, RecordingTransition transition,
					     std::optional<int> estimatedTotalChunks)
{
	const RecordingIdentity &identity = *result.identity;
	const int targetChunkIndex = *result.targetChunkIndex;

	const ChunkDestination destination{identity.title, identity.sourceUrl, targetChunkIndex, *result.window};

	logger_->info("ChunkReady", {{"chunkIndex", std::to_string(targetChunkIndex)},
				     {"startMinute", std::to_string(result.window->startMinute)},
				     {"segments", std::to_string(result.manifest->segments.size())}});

	bool dispatched = false;
	try {
		dispatched = downloader_->dispatch(result.manifest->text, destination);
	} catch (const DownloadDispatchError &e) {
		logger_->error("ChunkDownloadError", {{"chunkIndex", std::to_string(targetChunkIndex)},
						      {"exception", e.what()}});
	}

	if (!dispatched) {
		logger_->error("ChunkDownloadFailed", {{"chunkIndex", std::to_string(targetChunkIndex)}});
		result.outcome = PollOutcome::ChunkDownloadFailed;
		return result;
	}

	ProgressRecord updated;
	updated.lastSeenTimestamp = identity.createdAtTimestamp;
	updated.lastSeenUrl = identity.sourceUrl;
	updated.chunksAcquired = targetChunkIndex + 1;
	updated.estimatedTotalChunks = estimatedTotalChunks;
	progressStore_->save(config_.memoryFilePath, updated);

	logger_->info("ProgressCommitted", {{"chunksAcquired", std::to_string(updated.chunksAcquired)},
					    {"estimatedTotalChunks", formatOptional(estimatedTotalChunks)}});

	result.outcome = transition == RecordingTransition::New ? PollOutcome::NewRecordingChunkDownloaded
								: PollOutcome::ContinuedChunkDownloaded;
	return result;
}

} // namespace LiveVodArchiver::Acquisition
