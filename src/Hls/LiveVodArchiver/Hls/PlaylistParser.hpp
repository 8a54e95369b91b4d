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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "HlsTypes.hpp"

namespace LiveVodArchiver::Hls {

enum class PlaylistEntryKind {
	Directive,
	Segment,
	EndList,
};

/**
 * Lexical unit of a playlist. A Segment entry pairs an "#EXTINF" directive with the
 * URI line that follows it; every other non-blank line is a Directive entry except
 * the end-of-list marker.
 */
struct PlaylistEntry {
	PlaylistEntryKind kind = PlaylistEntryKind::Directive;
	std::string line;
	std::string uri;
};

class PlaylistParser {
public:
	PlaylistParser() = default;
	~PlaylistParser() noexcept = default;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	/**
	 * Parses raw playlist text.
	 *
	 * @throws MalformedPlaylistError when no segment can be found.
	 */
	ParsedPlaylist parse(std::string_view rawText) const;

	static std::vector<PlaylistEntry> tokenize(std::string_view rawText);

	static std::optional<double> parseSegmentDuration(std::string_view directive) noexcept;

private:
	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Hls
