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

#include <LiveVodArchiver/Hls/HlsErrors.hpp>
#include <LiveVodArchiver/Hls/PlaylistParser.hpp>

#include <RecordingLogger.hpp>

using namespace LiveVodArchiver;
using namespace LiveVodArchiver::Hls;

class PlaylistParserTest : public ::testing::Test {
protected:
	std::shared_ptr<TestSupport::RecordingLogger> logger = std::make_shared<TestSupport::RecordingLogger>();
	PlaylistParser parser;

	void SetUp() override { parser.setLogger(logger); }
};

TEST_F(PlaylistParserTest, ParsesHeadersSegmentsAndEndList)
{
	const std::string text = "#EXTM3U\n"
				 "#EXT-X-VERSION:3\n"
				 "#EXT-X-TARGETDURATION:6\n"
				 "#EXTINF:6.000,\n"
				 "seg0.ts\n"
				 "#EXTINF:5.5,title\n"
				 "seg1.ts\n"
				 "#EXT-X-ENDLIST\n";

	const ParsedPlaylist playlist = parser.parse(text);

	ASSERT_EQ(playlist.segments.size(), 2u);
	EXPECT_DOUBLE_EQ(playlist.segments[0].duration, 6.0);
	EXPECT_EQ(playlist.segments[0].uri, "seg0.ts");
	EXPECT_EQ(playlist.segments[0].durationDirective, "#EXTINF:6.000,");
	EXPECT_DOUBLE_EQ(playlist.segments[1].duration, 5.5);
	EXPECT_EQ(playlist.segments[1].uri, "seg1.ts");

	ASSERT_EQ(playlist.headerLines.size(), 3u);
	EXPECT_EQ(playlist.headerLines[0], "#EXTM3U");
	EXPECT_EQ(playlist.headerLines[2], "#EXT-X-TARGETDURATION:6");

	EXPECT_TRUE(playlist.isFinalized);
	EXPECT_DOUBLE_EQ(playlist.totalDurationSeconds(), 11.5);
}

TEST_F(PlaylistParserTest, LivePlaylistIsNotFinalized)
{
	const ParsedPlaylist playlist = parser.parse("#EXTM3U\n#EXTINF:2.0,\na.ts\n");
	EXPECT_FALSE(playlist.isFinalized);
	ASSERT_EQ(playlist.segments.size(), 1u);
}

TEST_F(PlaylistParserTest, HandlesCarriageReturnsAndBlankLines)
{
	const ParsedPlaylist playlist = parser.parse("#EXTM3U\r\n\r\n#EXTINF:4,\r\n\r\nhttps://cdn/a.ts\r\n");
	ASSERT_EQ(playlist.segments.size(), 1u);
	EXPECT_EQ(playlist.segments[0].uri, "https://cdn/a.ts");
	EXPECT_DOUBLE_EQ(playlist.segments[0].duration, 4.0);
}

TEST_F(PlaylistParserTest, SkipsDirectivesBetweenExtinfAndUri)
{
	const ParsedPlaylist playlist =
		parser.parse("#EXTM3U\n#EXTINF:3.0,\n#EXT-X-PROGRAM-DATE-TIME:2025-01-01T00:00:00Z\nseg.ts\n");
	ASSERT_EQ(playlist.segments.size(), 1u);
	EXPECT_EQ(playlist.segments[0].uri, "seg.ts");
}

TEST_F(PlaylistParserTest, DirectivesAfterFirstSegmentAreNotHeaders)
{
	const ParsedPlaylist playlist = parser.parse("#EXTM3U\n#EXTINF:3.0,\na.ts\n#EXT-X-DISCONTINUITY\n"
						     "#EXTINF:3.0,\nb.ts\n");
	ASSERT_EQ(playlist.headerLines.size(), 1u);
	EXPECT_EQ(playlist.segments.size(), 2u);
}

TEST_F(PlaylistParserTest, UnparsableDurationFallsBackToTenSeconds)
{
	const ParsedPlaylist playlist = parser.parse("#EXTM3U\n#EXTINF:abc,\na.ts\n#EXTINF:-1,\nb.ts\n");
	ASSERT_EQ(playlist.segments.size(), 2u);
	EXPECT_DOUBLE_EQ(playlist.segments[0].duration, kFallbackSegmentDurationSeconds);
	EXPECT_DOUBLE_EQ(playlist.segments[1].duration, kFallbackSegmentDurationSeconds);
	EXPECT_TRUE(logger->has("SegmentDurationFallback"));
}

TEST_F(PlaylistParserTest, ExtinfWithoutUriIsNotASegment)
{
	const ParsedPlaylist playlist = parser.parse("#EXTM3U\n#EXTINF:3.0,\na.ts\n#EXTINF:3.0,\n#EXT-X-ENDLIST\n");
	EXPECT_EQ(playlist.segments.size(), 1u);
	EXPECT_TRUE(playlist.isFinalized);
}

TEST_F(PlaylistParserTest, NoSegmentsThrowsMalformedPlaylistError)
{
	EXPECT_THROW(parser.parse("#EXTM3U\n#EXT-X-VERSION:3\n"), MalformedPlaylistError);
	EXPECT_THROW(parser.parse(""), MalformedPlaylistError);
	EXPECT_THROW(parser.parse("<html>not a playlist</html>"), MalformedPlaylistError);
}

TEST(PlaylistParserStaticTest, ParseSegmentDuration)
{
	EXPECT_EQ(PlaylistParser::parseSegmentDuration("#EXTINF:6.006,"), 6.006);
	EXPECT_EQ(PlaylistParser::parseSegmentDuration("#EXTINF:10"), 10.0);
	EXPECT_EQ(PlaylistParser::parseSegmentDuration("#EXTINF: 2.5 ,live"), 2.5);
	EXPECT_FALSE(PlaylistParser::parseSegmentDuration("#EXTINF"));
	EXPECT_FALSE(PlaylistParser::parseSegmentDuration("#EXTINF:,"));
	EXPECT_FALSE(PlaylistParser::parseSegmentDuration("#EXTINF:1.0x,"));
}

TEST(PlaylistParserStaticTest, TokenizePairsExtinfWithUri)
{
	const auto entries = PlaylistParser::tokenize("#EXTM3U\n#EXTINF:1,\nx.ts\n#EXT-X-ENDLIST");
	ASSERT_EQ(entries.size(), 3u);
	EXPECT_EQ(entries[0].kind, PlaylistEntryKind::Directive);
	EXPECT_EQ(entries[1].kind, PlaylistEntryKind::Segment);
	EXPECT_EQ(entries[1].uri, "x.ts");
	EXPECT_EQ(entries[2].kind, PlaylistEntryKind::EndList);
}
