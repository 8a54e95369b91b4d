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

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LiveVodArchiver::Hls {

inline constexpr std::string_view kSegmentDurationTag = "#EXTINF";
inline constexpr std::string_view kEndListTag = "#EXT-X-ENDLIST";

inline constexpr double kFallbackSegmentDurationSeconds = 10.0;

struct Segment {
	double duration = 0.0;
	std::string uri;

	// Source "#EXTINF:..." line, re-emitted as-is when the segment is sliced.
	std::string durationDirective;
};

struct ParsedPlaylist {
	std::vector<Segment> segments;
	std::vector<std::string> headerLines;
	bool isFinalized = false;

	double totalDurationSeconds() const noexcept
	{
		double total = 0.0;
		for (const auto &segment : segments) {
			total += segment.duration;
		}
		return total;
	}
};

/**
 * One chunk request in whole minutes. An empty durationMinute means the window is
 * open and extends to the end of the content currently available.
 */
struct TimeWindow {
	int startMinute = 0;
	std::optional<int> durationMinute;

	bool isOpen() const noexcept { return !durationMinute.has_value(); }
};

struct ChunkManifest {
	std::vector<std::string> headerLines;
	std::vector<Segment> segments;

	std::size_t startIndex = 0;
	std::size_t endIndex = 0;
	double durationSeconds = 0.0;

	std::string text;
};

} // namespace LiveVodArchiver::Hls
