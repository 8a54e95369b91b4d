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

#include "ProgressRecord.hpp"

#include <cstdint>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "AcquisitionErrors.hpp"

namespace LiveVodArchiver::Acquisition {

namespace {

int readChunkCount(const nlohmann::json &value, const char *key)
{
	if (!value.is_number_integer()) {
		throw StateCorruptionError(fmt::format("StateCorruptionError(from_json):NonIntegerCount:{}", key));
	}
	if (value.is_number_unsigned()) {
		if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMaxRecordedChunks)) {
			throw StateCorruptionError(fmt::format("StateCorruptionError(from_json):CountOutOfRange:{}", key));
		}
		return static_cast<int>(value.get<std::uint64_t>());
	}

	const std::int64_t count = value.get<std::int64_t>();
	if (count < 0) {
		throw StateCorruptionError(fmt::format("StateCorruptionError(from_json):NegativeChunks:{}", key));
	}
	if (count > kMaxRecordedChunks) {
		throw StateCorruptionError(fmt::format("StateCorruptionError(from_json):CountOutOfRange:{}", key));
	}
	return static_cast<int>(count);
}

} // anonymous namespace

void to_json(nlohmann::json &j, const ProgressRecord &p)
{
	j = nlohmann::json{{"last_ts", p.lastSeenTimestamp},
			   {"vod_url", p.lastSeenUrl},
			   {"downloaded_chunks", p.chunksAcquired},
			   {"total_chunks", nullptr}};
	if (p.estimatedTotalChunks)
		j["total_chunks"] = *p.estimatedTotalChunks;
}

void from_json(const nlohmann::json &j, ProgressRecord &p)
{
	p = ProgressRecord{};

	if (j.contains("last_ts") && !j.at("last_ts").is_null())
		j.at("last_ts").get_to(p.lastSeenTimestamp);

	if (j.contains("vod_url") && j.at("vod_url").is_string())
		j.at("vod_url").get_to(p.lastSeenUrl);

	if (j.contains("downloaded_chunks") && !j.at("downloaded_chunks").is_null()) {
		p.chunksAcquired = readChunkCount(j.at("downloaded_chunks"), "downloaded_chunks");
	} else if (j.contains("downloaded_hours") && !j.at("downloaded_hours").is_null()) {
		// Files written while chunks were fixed at one hour.
		p.chunksAcquired = readChunkCount(j.at("downloaded_hours"), "downloaded_hours");
	}

	if (j.contains("total_chunks") && !j.at("total_chunks").is_null())
		p.estimatedTotalChunks = readChunkCount(j.at("total_chunks"), "total_chunks");
}

} // namespace LiveVodArchiver::Acquisition
