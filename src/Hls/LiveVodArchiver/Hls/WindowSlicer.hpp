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

#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "HlsTypes.hpp"

namespace LiveVodArchiver::Hls {

/**
 * Cuts a time window out of a parsed playlist and renders it as a standalone playlist
 * that always ends with "#EXT-X-ENDLIST".
 *
 * Segments are atomic: the first selected segment is the first one that starts at or
 * after the window start, and a closed window runs through the segment that crosses
 * the requested duration. A window that is not yet fully covered by the available
 * segments yields std::nullopt.
 */
class WindowSlicer {
public:
	WindowSlicer() = default;
	~WindowSlicer() noexcept = default;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	std::optional<ChunkManifest> slice(const ParsedPlaylist &playlist, const TimeWindow &window,
					   std::string_view baseUrl) const;

	// Manifest URL up to and including the last '/' of its path.
	static std::string baseUrlOf(std::string_view manifestUrl);

	static bool isAbsoluteUri(std::string_view uri) noexcept;

	static std::string render(const ChunkManifest &manifest, std::string_view baseUrl);

private:
	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Hls
