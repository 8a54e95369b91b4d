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

#include "PlaylistParser.hpp"

#include <charconv>
#include <cmath>
#include <string>

#include <fmt/format.h>

#include "HlsErrors.hpp"
#include "PlaylistLines.hpp"

namespace LiveVodArchiver::Hls {

namespace {

bool startsWith(std::string_view line, std::string_view prefix) noexcept
{
	return line.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

std::vector<PlaylistEntry> PlaylistParser::tokenize(std::string_view rawText)
{
	const std::vector<std::string_view> lines = splitLines(rawText);

	std::vector<PlaylistEntry> entries;
	for (std::size_t i = 0; i < lines.size(); ++i) {
		const std::string_view line = trimLine(lines[i]);
		if (line.empty()) {
			continue;
		}

		if (startsWith(line, kEndListTag)) {
			entries.push_back({PlaylistEntryKind::EndList, std::string(line), {}});
			continue;
		}

		if (!startsWith(line, kSegmentDurationTag)) {
			entries.push_back({PlaylistEntryKind::Directive, std::string(line), {}});
			continue;
		}

		// Tags such as #EXT-X-BYTERANGE may sit between #EXTINF and its URI.
		std::size_t j = i + 1;
		for (; j < lines.size(); ++j) {
			const std::string_view candidate = trimLine(lines[j]);
			if (candidate.empty()) {
				continue;
			}
			if (!isDirectiveLine(candidate)) {
				break;
			}
			if (startsWith(candidate, kSegmentDurationTag) || startsWith(candidate, kEndListTag)) {
				j = lines.size();
				break;
			}
		}

		if (j < lines.size()) {
			entries.push_back({PlaylistEntryKind::Segment, std::string(line), std::string(trimLine(lines[j]))});
			i = j;
		} else {
			entries.push_back({PlaylistEntryKind::Directive, std::string(line), {}});
		}
	}

	return entries;
}

std::optional<double> PlaylistParser::parseSegmentDuration(std::string_view directive) noexcept
{
	const auto colon = directive.find(':');
	if (colon == std::string_view::npos) {
		return std::nullopt;
	}

	std::string_view value = directive.substr(colon + 1);
	const auto comma = value.find(',');
	if (comma != std::string_view::npos) {
		value = value.substr(0, comma);
	}
	value = trimLine(value);
	if (value.empty()) {
		return std::nullopt;
	}

	double duration = 0.0;
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), duration);
	if (ec != std::errc() || ptr != value.data() + value.size()) {
		return std::nullopt;
	}
	if (!std::isfinite(duration) || duration < 0.0) {
		return std::nullopt;
	}
	return duration;
}

ParsedPlaylist PlaylistParser::parse(std::string_view rawText) const
{
	ParsedPlaylist playlist;

	std::size_t droppedDirectives = 0;
	std::size_t fallbackDurations = 0;
	for (auto &entry : tokenize(rawText)) {
		switch (entry.kind) {
		case PlaylistEntryKind::EndList:
			playlist.isFinalized = true;
			break;
		case PlaylistEntryKind::Directive:
			if (playlist.segments.empty() && !startsWith(entry.line, kSegmentDurationTag)) {
				playlist.headerLines.push_back(std::move(entry.line));
			} else {
				++droppedDirectives;
			}
			break;
		case PlaylistEntryKind::Segment: {
			std::optional<double> duration = parseSegmentDuration(entry.line);
			if (!duration) {
				++fallbackDurations;
				logger_->warn("SegmentDurationFallback",
					      {{"directive", entry.line},
					       {"fallback", fmt::format("{}", kFallbackSegmentDurationSeconds)}});
			}
			playlist.segments.push_back(Segment{duration.value_or(kFallbackSegmentDurationSeconds),
							    std::move(entry.uri), std::move(entry.line)});
			break;
		}
		}
	}

	if (playlist.segments.empty()) {
		logger_->error("PlaylistHasNoSegments");
		throw MalformedPlaylistError("MalformedPlaylistError(PlaylistParser::parse):NoSegments");
	}

	logger_->debug("PlaylistParsed", {{"segments", std::to_string(playlist.segments.size())},
					  {"headers", std::to_string(playlist.headerLines.size())},
					  {"droppedDirectives", std::to_string(droppedDirectives)},
					  {"fallbackDurations", std::to_string(fallbackDurations)},
					  {"finalized", playlist.isFinalized ? "true" : "false"}});

	return playlist;
}

} // namespace LiveVodArchiver::Hls
