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

#include <string_view>
#include <vector>

namespace LiveVodArchiver::Hls {

inline std::string_view trimLine(std::string_view line) noexcept
{
	constexpr std::string_view whitespace = " \t\r\n";
	const auto first = line.find_first_not_of(whitespace);
	if (first == std::string_view::npos) {
		return {};
	}
	const auto last = line.find_last_not_of(whitespace);
	return line.substr(first, last - first + 1);
}

// Splits on '\n'; a trailing '\r' is dropped so CRLF playlists read the same as LF ones.
inline std::vector<std::string_view> splitLines(std::string_view text)
{
	std::vector<std::string_view> lines;
	std::size_t pos = 0;
	while (pos < text.size()) {
		auto next = text.find('\n', pos);
		if (next == std::string_view::npos) {
			next = text.size();
		}
		std::string_view line = text.substr(pos, next - pos);
		if (!line.empty() && line.back() == '\r') {
			line.remove_suffix(1);
		}
		lines.push_back(line);
		pos = next + 1;
	}
	return lines;
}

inline bool isDirectiveLine(std::string_view line) noexcept
{
	return !line.empty() && line.front() == '#';
}

} // namespace LiveVodArchiver::Hls
