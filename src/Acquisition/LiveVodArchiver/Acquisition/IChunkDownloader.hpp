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

#include <string>

#include <LiveVodArchiver/Hls/HlsTypes.hpp>

namespace LiveVodArchiver::Acquisition {

struct ChunkDestination {
	std::string recordingTitle;
	std::string sourceUrl;
	int chunkIndex = 0;
	Hls::TimeWindow window;
};

class IChunkDownloader {
public:
	IChunkDownloader() noexcept = default;
	virtual ~IChunkDownloader() = default;

	IChunkDownloader(const IChunkDownloader &) = delete;
	IChunkDownloader &operator=(const IChunkDownloader &) = delete;
	IChunkDownloader(IChunkDownloader &&) = delete;
	IChunkDownloader &operator=(IChunkDownloader &&) = delete;

	/**
	 * Downloads the chunk described by the manifest text. Called again for the same
	 * chunk when a previous attempt was not committed, so it must overwrite safely.
	 *
	 * @return false, or throws DownloadDispatchError, when the chunk was not acquired.
	 */
	virtual bool dispatch(const std::string &manifestText, const ChunkDestination &destination) = 0;
};

} // namespace LiveVodArchiver::Acquisition
