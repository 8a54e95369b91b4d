/*
 * Live VOD Archiver - Test Support
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

#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <LiveVodArchiver/Logger/ILogger.hpp>

namespace LiveVodArchiver::TestSupport {

// Keeps the event names it receives so tests can assert on them.
class RecordingLogger : public Logger::ILogger {
public:
	bool has(std::string_view name) const
	{
		std::scoped_lock lock(mutex_);
		for (const auto &event : events_) {
			if (event == name)
				return true;
		}
		return false;
	}

	std::vector<std::string> events() const
	{
		std::scoped_lock lock(mutex_);
		return events_;
	}

protected:
	void log(Logger::LogLevel, std::string_view name, std::source_location,
		 std::span<const Logger::LogField>) const noexcept override
	{
		std::scoped_lock lock(mutex_);
		events_.emplace_back(name);
	}

private:
	mutable std::mutex mutex_;
	mutable std::vector<std::string> events_;
};

} // namespace LiveVodArchiver::TestSupport
