/*
 * Live VOD Archiver - Acquisition Module
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

#include <filesystem>
#include <memory>
#include <string_view>

#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

#include "ProgressRecord.hpp"

namespace LiveVodArchiver::Acquisition {

/**
 * File-backed ProgressRecord persistence.
 *
 * The file holds a JSON object. A file holding a single bare number, quoted or not, is
 * read as the last seen timestamp with every other field defaulted.
 */
class ProgressStore {
public:
	ProgressStore() = default;
	~ProgressStore() noexcept = default;

	ProgressStore(const ProgressStore &) = delete;
	ProgressStore &operator=(const ProgressStore &) = delete;
	ProgressStore(ProgressStore &&) = delete;
	ProgressStore &operator=(ProgressStore &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	// Never throws because of file contents; unreadable state falls back to the default record.
	ProgressRecord load(const std::filesystem::path &path) const;

	void save(const std::filesystem::path &path, const ProgressRecord &record) const;

	/**
	 * @throws StateCorruptionError when the content is neither a JSON object nor a bare number, or a chunk
	 * count in the object is not an integer within range.
	 */
	static ProgressRecord decode(std::string_view content);

private:
	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Acquisition
