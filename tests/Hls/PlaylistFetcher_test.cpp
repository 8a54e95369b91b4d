/*
 * Live VOD Archiver - Hls Module Tests
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

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

#include <LiveVodArchiver/CurlHelper/CurlEasyHandle.hpp>
#include <LiveVodArchiver/CurlHelper/CurlStringWriteCallback.hpp>
#include <LiveVodArchiver/CurlHelper/CurlUrl.hpp>
#include <LiveVodArchiver/Hls/HlsErrors.hpp>
#include <LiveVodArchiver/Hls/PlaylistFetcher.hpp>

#include <TemporaryFile.hpp>

using namespace LiveVodArchiver;
using namespace LiveVodArchiver::Hls;

class PlaylistFetcherTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }

	CurlPlaylistFetcher fetcher{std::make_shared<CurlHelper::CurlEasyHandle>()};
};

TEST_F(PlaylistFetcherTest, EmptyUrlIsRejected)
{
	EXPECT_THROW(fetcher.fetch(""), std::invalid_argument);
}

TEST_F(PlaylistFetcherTest, NullCurlHandleIsRejected)
{
	EXPECT_THROW(CurlPlaylistFetcher(nullptr), std::invalid_argument);
}

TEST_F(PlaylistFetcherTest, FetchesLocalFile)
{
	TestSupport::TemporaryFile file("index.m3u8");
	file.write("#EXTM3U\n#EXTINF:6,\na.ts\n");

	const std::string text = fetcher.fetch("file://" + file.path.string());

	EXPECT_EQ(text, "#EXTM3U\n#EXTINF:6,\na.ts\n");
}

TEST_F(PlaylistFetcherTest, MissingLocalFileIsNetworkError)
{
	TestSupport::TemporaryFile file("absent.m3u8");
	EXPECT_THROW(fetcher.fetch("file://" + file.path.string()), NetworkError);
}

TEST_F(PlaylistFetcherTest, MalformedUrlIsNetworkError)
{
	EXPECT_THROW(fetcher.fetch("http://[::1"), NetworkError);
}

TEST(CurlStringWriteCallbackTest, AppendsUntilCapThenAborts)
{
	CurlHelper::CurlStringSink sink;
	sink.maxBytes = 8;

	char first[] = "abcde";
	EXPECT_EQ(CurlHelper::CurlStringWriteCallback(first, 1, 5, &sink), 5u);
	EXPECT_EQ(sink.body, "abcde");

	char second[] = "fghij";
	EXPECT_EQ(CurlHelper::CurlStringWriteCallback(second, 1, 5, &sink), CURL_WRITEFUNC_ERROR);
	EXPECT_TRUE(sink.overflowed);
	EXPECT_EQ(sink.body, "abcde");
}

TEST(CurlUrlTest, RejectsUnparsableUrl)
{
	EXPECT_THROW(CurlHelper::normalizeUrl("http://[::1"), std::runtime_error);
}
