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

#include <map>
#include <memory>
#include <string>

#include <LiveVodArchiver/Hls/HlsErrors.hpp>
#include <LiveVodArchiver/Hls/ReadinessClassifier.hpp>

using namespace LiveVodArchiver::Hls;

namespace {

class FakePlaylistFetcher : public IPlaylistFetcher {
public:
	std::map<std::string, std::string> responses;
	int calls = 0;

	std::string fetch(const std::string &url) override
	{
		++calls;
		auto it = responses.find(url);
		if (it == responses.end()) {
			throw NetworkError("NetworkError(FakePlaylistFetcher::fetch):NotFound");
		}
		return it->second;
	}
};

} // anonymous namespace

class ReadinessClassifierTest : public ::testing::Test {
protected:
	std::shared_ptr<FakePlaylistFetcher> fetcher = std::make_shared<FakePlaylistFetcher>();
	ReadinessClassifier classifier{fetcher};
};

TEST_F(ReadinessClassifierTest, FinalizedWhenEndListPresent)
{
	fetcher->responses["https://cdn/vod.m3u8"] = "#EXTM3U\n#EXTINF:6,\na.ts\n#EXT-X-ENDLIST\n";
	EXPECT_TRUE(classifier.isFinalized("https://cdn/vod.m3u8"));
	EXPECT_EQ(fetcher->calls, 1);
}

TEST_F(ReadinessClassifierTest, LiveWhenEndListAbsent)
{
	fetcher->responses["https://cdn/live.m3u8"] = "#EXTM3U\n#EXTINF:6,\na.ts\n";
	EXPECT_FALSE(classifier.isFinalized("https://cdn/live.m3u8"));
}

TEST_F(ReadinessClassifierTest, FetchFailurePropagates)
{
	EXPECT_THROW(classifier.isFinalized("https://cdn/missing.m3u8"), NetworkError);
}

TEST(ReadinessClassifierStaticTest, ContainsEndList)
{
	EXPECT_TRUE(ReadinessClassifier::containsEndList("#EXTM3U\r\n#EXT-X-ENDLIST\r\n"));
	EXPECT_TRUE(ReadinessClassifier::containsEndList("  #EXT-X-ENDLIST  "));
	EXPECT_FALSE(ReadinessClassifier::containsEndList("#EXTM3U\nseg#EXT-X-ENDLIST.ts\n"));
	EXPECT_FALSE(ReadinessClassifier::containsEndList(""));
}

TEST(ReadinessClassifierStaticTest, NullFetcherIsRejected)
{
	EXPECT_THROW(ReadinessClassifier(nullptr), std::invalid_argument);
}
