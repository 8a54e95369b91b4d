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

#include <cstddef>
#include <exception>
#include <string>

#include <curl/curl.h>

namespace LiveVodArchiver::CurlHelper {

// Response body collected by CurlStringWriteCallback. Bodies beyond maxBytes abort the transfer.
struct CurlStringSink {
	std::string body;
	std::size_t maxBytes = 0;
	bool overflowed = false;
};

inline std::size_t CurlStringWriteCallback(char *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	auto *sink = static_cast<CurlStringSink *>(userp);
	if (size != 0 && nmemb > sink->maxBytes / size) {
		sink->overflowed = true;
		return CURL_WRITEFUNC_ERROR;
	}

	const std::size_t totalSize = size * nmemb;
	if (totalSize > sink->maxBytes - sink->body.size()) {
		sink->overflowed = true;
		return CURL_WRITEFUNC_ERROR;
	}

	try {
		sink->body.append(contents, totalSize);
	} catch (const std::exception &) {
		return CURL_WRITEFUNC_ERROR;
	}
	return totalSize;
}

} // namespace LiveVodArchiver::CurlHelper
