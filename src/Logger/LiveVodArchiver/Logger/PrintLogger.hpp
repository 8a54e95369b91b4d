/*
 * Live VOD Archiver - Logger Library
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

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace LiveVodArchiver::Logger {

/**
 * Writes one logfmt-style line per event to a stdio stream (stderr by default).
 */
class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info, std::FILE *stream = stderr) noexcept
		: ILogger(minLevel),
		  stream_(stream)
	{
	}

	~PrintLogger() override = default;

	static std::optional<LogLevel> parseLevel(std::string_view str) noexcept
	{
		if (str == "debug")
			return LogLevel::Debug;
		if (str == "info")
			return LogLevel::Info;
		if (str == "warn")
			return LogLevel::Warn;
		if (str == "error")
			return LogLevel::Error;
		return std::nullopt;
	}

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		try {
			fmt::memory_buffer buf;
			fmt::format_to(std::back_inserter(buf), "level={}\tname={}\tlocation={}:{}", levelName(level),
				       name, std::filesystem::path(loc.file_name()).filename().string(), loc.line());
			for (const auto &field : context) {
				fmt::format_to(std::back_inserter(buf), "\t{}={}", field.key, field.value);
			}
			buf.push_back('\n');
			std::fwrite(buf.data(), 1, buf.size(), stream_);
			std::fflush(stream_);
		} catch (const std::exception &) {
			std::fputs("level=ERROR\tname=LoggerFormatError\n", stream_);
		}
	}

private:
	static std::string_view levelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "DEBUG";
		case LogLevel::Info:
			return "INFO";
		case LogLevel::Warn:
			return "WARN";
		case LogLevel::Error:
			return "ERROR";
		default:
			return "UNKNOWN";
		}
	}

	std::FILE *const stream_;
};

} // namespace LiveVodArchiver::Logger
