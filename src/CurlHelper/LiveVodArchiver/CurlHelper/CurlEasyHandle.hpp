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
 * Owns one easy handle. Options are applied through setOption so that a rejected
 * option surfaces as an exception instead of a silently ignored CURLcode.
 */
class CurlEasyHandle {
public:
	CurlEasyHandle() : curl_(curl_easy_init(), &curl_easy_cleanup)
	{
		if (!curl_)
			throw std::runtime_error("CurlInitError(CurlEasyHandle)");
	}

	~CurlEasyHandle() noexcept = default;

	CurlEasyHandle(const CurlEasyHandle &) = delete;
	CurlEasyHandle &operator=(const CurlEasyHandle &) = delete;
	CurlEasyHandle(CurlEasyHandle &&) = delete;
	CurlEasyHandle &operator=(CurlEasyHandle &&) = delete;

	// Drops every option set by a previous request; connections stay cached.
	void reset() noexcept { curl_easy_reset(curl_.get()); }

	template<typename T> void setOption(CURLoption option, T value)
	{
		const CURLcode code = curl_easy_setopt(curl_.get(), option, value);
		if (code != CURLE_OK) {
			throw std::runtime_error("CurlSetOptionError(CurlEasyHandle::setOption):" +
						 std::string(curl_easy_strerror(code)));
		}
	}

	[[nodiscard]]
	CURLcode perform() noexcept
	{
		return curl_easy_perform(curl_.get());
	}

	// Zero for schemes without a status line such as file://.
	[[nodiscard]]
	long responseCode() const
	{
		long code = 0;
		const CURLcode res = curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &code);
		if (res != CURLE_OK) {
			throw std::runtime_error("CurlGetInfoError(CurlEasyHandle::responseCode):" +
						 std::string(curl_easy_strerror(res)));
		}
		return code;
	}

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

} // namespace LiveVodArchiver::CurlHelper
