/*
 * Live VOD Archiver - Hls Module
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

#include "WindowSlicer.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace LiveVodArchiver::Hls {

namespace {

constexpr double kSecondsPerMinute = 60.0;

std::string formatMinutes(double seconds)
{
	return fmt::format("{:.2f}", seconds / kSecondsPerMinute);
}

} // anonymous namespace

std::optional<ChunkManifest> WindowSlicer::slice(const ParsedPlaylist &playlist, const TimeWindow &window,
						 std::string_view baseUrl) const
{
	if (window.startMinute < 0) {
		throw std::invalid_argument("NegativeStartMinuteError(WindowSlicer::slice)");
	}
	if (window.durationMinute && *window.durationMinute <= 0) {
		throw std::invalid_argument("NonPositiveDurationMinuteError(WindowSlicer::slice)");
	}

	const auto &segments = playlist.segments;
	const double totalAvailableSeconds = playlist.totalDurationSeconds();
	const double startSeconds = static_cast<double>(window.startMinute) * kSecondsPerMinute;

	if (totalAvailableSeconds < startSeconds) {
		logger_->info("WindowStartNotReached", {{"availableMinutes", formatMinutes(totalAvailableSeconds)},
							{"startMinute", std::to_string(window.startMinute)}});
		return std::nullopt;
	}

	std::size_t startIndex = segments.size();
	double segmentStartSeconds = 0.0;
	for (std::size_t i = 0; i < segments.size(); ++i) {
		if (segmentStartSeconds >= startSeconds) {
			startIndex = i;
			break;
		}
		segmentStartSeconds += segments[i].duration;
	}

	std::size_t endIndex = segments.size();
	if (window.durationMinute) {
		const double durationSeconds = static_cast<double>(*window.durationMinute) * kSecondsPerMinute;
		const double requiredEndSeconds = startSeconds + durationSeconds;
		if (totalAvailableSeconds < requiredEndSeconds) {
			logger_->info("WindowEndNotReached",
				      {{"availableMinutes", formatMinutes(totalAvailableSeconds)},
				       {"requiredEndMinutes", formatMinutes(requiredEndSeconds)}});
			return std::nullopt;
		}

		std::optional<std::size_t> crossingIndex;
		double accumulated = 0.0;
		for (std::size_t i = startIndex; i < segments.size(); ++i) {
			accumulated += segments[i].duration;
			if (accumulated >= durationSeconds) {
				crossingIndex = i;
				break;
			}
		}

		if (!crossingIndex) {
			// The selection would start after the window start and come up short of the duration.
			logger_->info("WindowNotCoveredFromSegmentBoundary",
				      {{"startIndex", std::to_string(startIndex)},
				       {"accumulatedMinutes", formatMinutes(accumulated)}});
			return std::nullopt;
		}
		endIndex = *crossingIndex + 1;
	}

	if (startIndex >= endIndex) {
		logger_->info("WindowSelectionEmpty", {{"startMinute", std::to_string(window.startMinute)}});
		return std::nullopt;
	}

	ChunkManifest manifest;
	manifest.headerLines = playlist.headerLines;
	manifest.segments.assign(segments.begin() + static_cast<std::ptrdiff_t>(startIndex),
				 segments.begin() + static_cast<std::ptrdiff_t>(endIndex));
	manifest.startIndex = startIndex;
	manifest.endIndex = endIndex;
	for (const auto &segment : manifest.segments) {
		manifest.durationSeconds += segment.duration;
	}
	manifest.text = render(manifest, baseUrl);

	logger_->info("WindowSliced",
		      {{"totalSegments", std::to_string(segments.size())},
		       {"startMinute", std::to_string(window.startMinute)},
		       {"startIndex", std::to_string(startIndex)},
		       {"durationTarget", window.durationMinute ? std::to_string(*window.durationMinute) : "UntilEnd"},
		       {"selectedSegments", std::to_string(manifest.segments.size())},
		       {"selectedMinutes", formatMinutes(manifest.durationSeconds)}});

	return manifest;
}

std::string WindowSlicer::baseUrlOf(std::string_view manifestUrl)
{
	std::string_view path = manifestUrl.substr(0, manifestUrl.find_first_of("?#"));
	const auto lastSlash = path.rfind('/');
	if (lastSlash == std::string_view::npos) {
		return {};
	}
	return std::string(path.substr(0, lastSlash + 1));
}

bool WindowSlicer::isAbsoluteUri(std::string_view uri) noexcept
{
	return uri.starts_with("http://") || uri.starts_with("https://");
}

std::string WindowSlicer::render(const ChunkManifest &manifest, std::string_view baseUrl)
{
	std::string text;
	for (const auto &line : manifest.headerLines) {
		text += line;
		text += '\n';
	}

	for (const auto &segment : manifest.segments) {
		if (segment.durationDirective.empty()) {
			text += fmt::format("{}:{:.3f},\n", kSegmentDurationTag, segment.duration);
		} else {
			text += segment.durationDirective;
			text += '\n';
		}

		if (isAbsoluteUri(segment.uri)) {
			text += segment.uri;
		} else {
			text += baseUrl;
			text += segment.uri;
		}
		text += '\n';
	}

	text += kEndListTag;
	return text;
}

} // namespace LiveVodArchiver::Hls
