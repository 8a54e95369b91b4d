/*
 * Live VOD Archiver - CurlHelper Library
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
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace LiveVodArchiver::CurlHelper {

/**
 * Parses a URL with libcurl's URL API and returns it in canonical form.
 *
 * @throws std::runtime_error when libcurl rejects the URL.
 */
inline std::string normalizeUrl(const std::string &url)
{
	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
	if (!handle) {
		throw std::runtime_error("CurlUrlInitError(normalizeUrl)");
	}

	CURLUcode uc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
	if (uc != CURLUE_OK) {
		throw std::runtime_error("CurlUrlParseError(normalizeUrl):" + std::string(curl_url_strerror(uc)));
	}

	char *normalized = nullptr;
	uc = curl_url_get(handle.get(), CURLUPART_URL, &normalized, 0);
	if (uc != CURLUE_OK || !normalized) {
		throw std::runtime_error("CurlUrlGetError(normalizeUrl):" + std::string(curl_url_strerror(uc)));
	}
	std::unique_ptr<char, decltype(&curl_free)> guard(normalized, &curl_free);
	return std::string(guard.get());
}

} // namespace LiveVodArchiver::CurlHelper
