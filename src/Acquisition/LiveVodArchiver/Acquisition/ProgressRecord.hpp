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

#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace LiveVodArchiver::Acquisition {

// Largest chunk count a state file may carry; one-hour chunks up to this count stay within int minutes.
inline constexpr int kMaxRecordedChunks = std::numeric_limits<int>::max() / 60;

struct ProgressRecord {
	double lastSeenTimestamp = 0.0;
	std::string lastSeenUrl;
	int chunksAcquired = 0;
	std::optional<int> estimatedTotalChunks;

	bool operator==(const ProgressRecord &) const = default;
};

void to_json(nlohmann::json &j, const ProgressRecord &p);
/**
 * @throws StateCorruptionError when a chunk count is not an integer in [0, kMaxRecordedChunks].
 */
void from_json(const nlohmann::json &j, ProgressRecord &p);

} // namespace LiveVodArchiver::Acquisition
