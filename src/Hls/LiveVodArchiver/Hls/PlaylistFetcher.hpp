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
#include <string>

#include <LiveVodArchiver/CurlHelper/CurlEasyHandle.hpp>
#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

namespace LiveVodArchiver::Hls {

class IPlaylistFetcher {
public:
	IPlaylistFetcher() noexcept = default;
	virtual ~IPlaylistFetcher() = default;

	IPlaylistFetcher(const IPlaylistFetcher &) = delete;
	IPlaylistFetcher &operator=(const IPlaylistFetcher &) = delete;
	IPlaylistFetcher(IPlaylistFetcher &&) = delete;
	IPlaylistFetcher &operator=(IPlaylistFetcher &&) = delete;

	/**
	 * Retrieves the raw playlist text.
	 *
	 * @throws NetworkError on transport failure, timeout or a non-2xx HTTP status.
	 */
	virtual std::string fetch(const std::string &url) = 0;
};

class CurlPlaylistFetcher final : public IPlaylistFetcher {
public:
	explicit CurlPlaylistFetcher(std::shared_ptr<CurlHelper::CurlEasyHandle> curl);
	~CurlPlaylistFetcher() noexcept override;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	std::string fetch(const std::string &url) override;

private:
	std::shared_ptr<CurlHelper::CurlEasyHandle> curl_;

	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Hls
