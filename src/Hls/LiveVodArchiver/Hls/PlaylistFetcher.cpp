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

#include "PlaylistFetcher.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <LiveVodArchiver/CurlHelper/CurlHeaderList.hpp>
#include <LiveVodArchiver/CurlHelper/CurlStringWriteCallback.hpp>
#include <LiveVodArchiver/CurlHelper/CurlUrl.hpp>

#include "HlsErrors.hpp"

namespace LiveVodArchiver::Hls {

namespace {

constexpr std::size_t kMaxPlaylistBytes = 64 * 1024 * 1024;

} // anonymous namespace

CurlPlaylistFetcher::CurlPlaylistFetcher(std::shared_ptr<CurlHelper::CurlEasyHandle> curl) : curl_(std::move(curl))
{
	if (!curl_) {
		throw std::invalid_argument("CurlIsNullError(CurlPlaylistFetcher::CurlPlaylistFetcher)");
	}
}

CurlPlaylistFetcher::~CurlPlaylistFetcher() noexcept = default;

std::string CurlPlaylistFetcher::fetch(const std::string &url)
{
	if (url.empty()) {
		logger_->error("UrlIsEmptyError");
		throw std::invalid_argument("UrlIsEmptyError(CurlPlaylistFetcher::fetch)");
	}

	std::string normalizedUrl;
	try {
		normalizedUrl = CurlHelper::normalizeUrl(url);
	} catch (const std::runtime_error &e) {
		logger_->error("PlaylistUrlParseError", {{"url", url}, {"exception", e.what()}});
		throw NetworkError(fmt::format("NetworkError(CurlPlaylistFetcher::fetch):{}", e.what()));
	}

	const CurlHelper::CurlHeaderList headers{"Accept: application/vnd.apple.mpegurl, application/x-mpegurl, */*"};
	CurlHelper::CurlStringSink sink;
	sink.maxBytes = kMaxPlaylistBytes;

	curl_->reset();
	try {
		curl_->setOption(CURLOPT_URL, normalizedUrl.c_str());
		curl_->setOption(CURLOPT_HTTPHEADER, headers.get());
		curl_->setOption(CURLOPT_USERAGENT, "live-vod-archiver");
		curl_->setOption(CURLOPT_FOLLOWLOCATION, 1L);
		curl_->setOption(CURLOPT_MAXREDIRS, 5L);

		curl_->setOption(CURLOPT_WRITEFUNCTION, &CurlHelper::CurlStringWriteCallback);
		curl_->setOption(CURLOPT_WRITEDATA, static_cast<void *>(&sink));

		curl_->setOption(CURLOPT_CONNECTTIMEOUT, 10L);
		curl_->setOption(CURLOPT_TIMEOUT, 60L);
		curl_->setOption(CURLOPT_NOSIGNAL, 1L);
	} catch (const std::runtime_error &e) {
		logger_->error("CurlSetupError", {{"url", normalizedUrl}, {"exception", e.what()}});
		throw NetworkError(fmt::format("NetworkError(CurlPlaylistFetcher::fetch):{}", e.what()));
	}

	const CURLcode res = curl_->perform();

	if (sink.overflowed) {
		logger_->error("PlaylistTooLargeError", {{"url", normalizedUrl}});
		throw NetworkError("NetworkError(CurlPlaylistFetcher::fetch):PlaylistTooLarge");
	}

	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"url", normalizedUrl}, {"error", curl_easy_strerror(res)}});
		throw NetworkError(
			fmt::format("NetworkError(CurlPlaylistFetcher::fetch):{}", curl_easy_strerror(res)));
	}

	long responseCode = 0;
	try {
		responseCode = curl_->responseCode();
	} catch (const std::runtime_error &e) {
		throw NetworkError(fmt::format("NetworkError(CurlPlaylistFetcher::fetch):{}", e.what()));
	}

	if (responseCode != 0 && (responseCode < 200 || responseCode >= 300)) {
		logger_->error("PlaylistHttpStatusError",
			       {{"url", normalizedUrl}, {"status", std::to_string(responseCode)}});
		throw NetworkError(fmt::format("NetworkError(CurlPlaylistFetcher::fetch):HTTP {}", responseCode));
	}

	logger_->debug("PlaylistFetched", {{"url", normalizedUrl}, {"bytes", std::to_string(sink.body.size())}});

	return std::move(sink.body);
}

} // namespace LiveVodArchiver::Hls
