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

#include <initializer_list>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace LiveVodArchiver::CurlHelper {

// Request headers for CURLOPT_HTTPHEADER; must outlive the transfer that uses them.
class CurlHeaderList {
public:
	CurlHeaderList(std::initializer_list<const char *> headers)
	{
		for (const char *header : headers) {
			curl_slist *appended = curl_slist_append(list_, header);
			if (!appended) {
				curl_slist_free_all(list_);
				throw std::runtime_error("CurlHeaderAppendError(CurlHeaderList):" + std::string(header));
			}
			list_ = appended;
		}
	}

	~CurlHeaderList() noexcept { curl_slist_free_all(list_); }

	CurlHeaderList(const CurlHeaderList &) = delete;
	CurlHeaderList &operator=(const CurlHeaderList &) = delete;
	CurlHeaderList(CurlHeaderList &&) = delete;
	CurlHeaderList &operator=(CurlHeaderList &&) = delete;

	curl_slist *get() const noexcept { return list_; }

private:
	curl_slist *list_ = nullptr;
};

} // namespace LiveVodArchiver::CurlHelper
