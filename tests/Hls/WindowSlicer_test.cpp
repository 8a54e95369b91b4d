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

#include <string>
#include <vector>

#include <LiveVodArchiver/Hls/PlaylistParser.hpp>
#include <LiveVodArchiver/Hls/WindowSlicer.hpp>

using namespace LiveVodArchiver::Hls;

namespace {

ParsedPlaylist uniformPlaylist(std::size_t count, double duration, bool finalized = false)
{
	ParsedPlaylist playlist;
	playlist.headerLines = {"#EXTM3U", "#EXT-X-VERSION:3"};
	for (std::size_t i = 0; i < count; ++i) {
		playlist.segments.push_back(Segment{duration, "seg" + std::to_string(i) + ".ts", ""});
	}
	playlist.isFinalized = finalized;
	return playlist;
}

int countOccurrences(const std::string &text, const std::string &needle)
{
	int count = 0;
	for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
		++count;
	}
	return count;
}

} // anonymous namespace

class WindowSlicerTest : public ::testing::Test {
protected:
	WindowSlicer slicer;
	const std::string baseUrl = "https://cdn.example.com/vod/";
};

TEST_F(WindowSlicerTest, ExactlyEnoughContentSelectsEverySegment)
{
	const auto playlist = uniformPlaylist(10, 6.0);

	const auto manifest = slicer.slice(playlist, TimeWindow{0, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_EQ(manifest->segments.size(), 10u);
	EXPECT_EQ(manifest->startIndex, 0u);
	EXPECT_EQ(manifest->endIndex, 10u);
	EXPECT_DOUBLE_EQ(manifest->durationSeconds, 60.0);
}

TEST_F(WindowSlicerTest, SlightlyShortContentIsNotReady)
{
	auto playlist = uniformPlaylist(10, 6.0);
	playlist.segments.back().duration = 5.9;

	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{0, 1}, baseUrl).has_value());
}

TEST_F(WindowSlicerTest, SecondMinuteOfOneMinutePlaylistIsNotReady)
{
	const auto playlist = uniformPlaylist(10, 6.0);
	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{1, 1}, baseUrl).has_value());
}

TEST_F(WindowSlicerTest, StartBeyondTotalIsNotReadyForOpenAndClosedWindows)
{
	const auto playlist = uniformPlaylist(10, 6.0, true);
	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{5, 1}, baseUrl).has_value());
	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{5, std::nullopt}, baseUrl).has_value());
}

TEST_F(WindowSlicerTest, StartExactlyAtTotalHasNothingToSelect)
{
	const auto playlist = uniformPlaylist(10, 6.0);
	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{1, std::nullopt}, baseUrl).has_value());
}

TEST_F(WindowSlicerTest, StartsAtFirstSegmentWhoseStartReachesThreshold)
{
	// Segment starts: 0, 7, 14, ... 63, 70, ...
	const auto playlist = uniformPlaylist(30, 7.0);

	const auto manifest = slicer.slice(playlist, TimeWindow{1, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_EQ(manifest->startIndex, 9u);
	EXPECT_EQ(manifest->segments.front().uri, "seg9.ts");
}

TEST_F(WindowSlicerTest, SelectionIsTheShortestRunCoveringTheDuration)
{
	const auto playlist = uniformPlaylist(40, 7.0);

	const auto manifest = slicer.slice(playlist, TimeWindow{0, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_GE(manifest->durationSeconds, 60.0);
	const double withoutLast = manifest->durationSeconds - manifest->segments.back().duration;
	EXPECT_LT(withoutLast, 60.0);
	EXPECT_EQ(manifest->segments.size(), 9u);
}

TEST_F(WindowSlicerTest, OpenWindowTakesEverythingFromStart)
{
	const auto playlist = uniformPlaylist(20, 6.0);

	const auto manifest = slicer.slice(playlist, TimeWindow{1, std::nullopt}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_EQ(manifest->startIndex, 10u);
	EXPECT_EQ(manifest->endIndex, 20u);
	EXPECT_DOUBLE_EQ(manifest->durationSeconds, 60.0);
}

TEST_F(WindowSlicerTest, ShortTailNotCoveredFromSegmentBoundaryIsNotReady)
{
	// Minute 1 falls inside the 20 s segment spanning [50, 70); selection starts at 70 s.
	ParsedPlaylist playlist;
	for (double d : {10.0, 10.0, 10.0, 10.0, 10.0, 20.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0}) {
		playlist.segments.push_back(Segment{d, "s.ts", ""});
	}

	const auto manifest = slicer.slice(playlist, TimeWindow{1, 1}, baseUrl);
	ASSERT_TRUE(manifest.has_value());
	EXPECT_EQ(manifest->startIndex, 6u);
	EXPECT_DOUBLE_EQ(manifest->durationSeconds, 60.0);

	// 129 s in total still reaches the 120 s window end, but 70..129 is shorter than a minute.
	playlist.segments.back().duration = 9.0;
	EXPECT_FALSE(slicer.slice(playlist, TimeWindow{1, 1}, baseUrl).has_value());
}

TEST_F(WindowSlicerTest, OutputAlwaysEndsWithEndListEvenForLivePlaylists)
{
	const auto playlist = uniformPlaylist(10, 6.0, false);

	const auto manifest = slicer.slice(playlist, TimeWindow{0, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_TRUE(manifest->text.ends_with("#EXT-X-ENDLIST"));
	EXPECT_EQ(countOccurrences(manifest->text, "#EXT-X-ENDLIST"), 1);
	EXPECT_TRUE(manifest->text.starts_with("#EXTM3U\n#EXT-X-VERSION:3\n"));
}

TEST_F(WindowSlicerTest, RelativeUrisAreResolvedAgainstBaseUrl)
{
	auto playlist = uniformPlaylist(2, 30.0);
	playlist.segments[1].uri = "https://other.example.com/abs.ts";

	const auto manifest = slicer.slice(playlist, TimeWindow{0, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_NE(manifest->text.find("https://cdn.example.com/vod/seg0.ts\n"), std::string::npos);
	EXPECT_NE(manifest->text.find("\nhttps://other.example.com/abs.ts\n"), std::string::npos);
	EXPECT_EQ(countOccurrences(manifest->text, "#EXTINF:30.000,"), 2);
}

TEST_F(WindowSlicerTest, PreservesOriginalExtinfLines)
{
	PlaylistParser parser;
	const auto playlist = parser.parse("#EXTM3U\n#EXTINF:30.0,live\na.ts\n#EXTINF:30.0,live\nb.ts\n");

	const auto manifest = slicer.slice(playlist, TimeWindow{0, 1}, baseUrl);

	ASSERT_TRUE(manifest.has_value());
	EXPECT_EQ(manifest->text, "#EXTM3U\n"
				  "#EXTINF:30.0,live\n"
				  "https://cdn.example.com/vod/a.ts\n"
				  "#EXTINF:30.0,live\n"
				  "https://cdn.example.com/vod/b.ts\n"
				  "#EXT-X-ENDLIST");
}

TEST_F(WindowSlicerTest, SlicingIsIdempotent)
{
	const auto playlist = uniformPlaylist(50, 6.5);
	const TimeWindow window{2, 2};

	const auto first = slicer.slice(playlist, window, baseUrl);
	const auto second = slicer.slice(playlist, window, baseUrl);

	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(first->text, second->text);
	EXPECT_EQ(first->startIndex, second->startIndex);
	EXPECT_EQ(first->endIndex, second->endIndex);
}

TEST_F(WindowSlicerTest, RejectsInvalidWindows)
{
	const auto playlist = uniformPlaylist(10, 6.0);
	EXPECT_THROW(slicer.slice(playlist, TimeWindow{-1, 1}, baseUrl), std::invalid_argument);
	EXPECT_THROW(slicer.slice(playlist, TimeWindow{0, 0}, baseUrl), std::invalid_argument);
}

TEST(WindowSlicerStaticTest, BaseUrlOf)
{
	EXPECT_EQ(WindowSlicer::baseUrlOf("https://cdn.example.com/vod/index.m3u8"), "https://cdn.example.com/vod/");
	EXPECT_EQ(WindowSlicer::baseUrlOf("https://cdn.example.com/a/b.m3u8?token=x/y"), "https://cdn.example.com/a/");
	EXPECT_EQ(WindowSlicer::baseUrlOf("index.m3u8"), "");
}

TEST(WindowSlicerStaticTest, IsAbsoluteUri)
{
	EXPECT_TRUE(WindowSlicer::isAbsoluteUri("http://a/b.ts"));
	EXPECT_TRUE(WindowSlicer::isAbsoluteUri("https://a/b.ts"));
	EXPECT_FALSE(WindowSlicer::isAbsoluteUri("b.ts"));
	EXPECT_FALSE(WindowSlicer::isAbsoluteUri("/abs/b.ts"));
}
