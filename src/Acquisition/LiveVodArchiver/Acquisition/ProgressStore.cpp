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

#include "ProgressStore.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "AcquisitionErrors.hpp"

namespace LiveVodArchiver::Acquisition {

ProgressRecord ProgressStore::decode(std::string_view content)
{
	nlohmann::json j = nlohmann::json::parse(content.begin(), content.end(), nullptr, false);
	if (j.is_discarded()) {
		throw StateCorruptionError("StateCorruptionError(ProgressStore::decode):NotJson");
	}

	ProgressRecord record;
	if (j.is_object()) {
		try {
			j.get_to(record);
		} catch (const nlohmann::json::exception &e) {
			throw StateCorruptionError(fmt::format("StateCorruptionError(ProgressStore::decode):{}", e.what()));
		}
	} else if (j.is_number()) {
		record.lastSeenTimestamp = j.get<double>();
	} else if (j.is_string()) {
		const auto &text = j.get_ref<const std::string &>();
		double timestamp = 0.0;
		const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), timestamp);
		if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
			throw StateCorruptionError("StateCorruptionError(ProgressStore::decode):UnexpectedString");
		}
		record.lastSeenTimestamp = timestamp;
	} else {
		throw StateCorruptionError("StateCorruptionError(ProgressStore::decode):UnexpectedType");
	}

	return record;
}

ProgressRecord ProgressStore::load(const std::filesystem::path &path) const
{
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec)) {
		logger_->info("ProgressFileNotExist", {{"path", path.string()}});
		return ProgressRecord{};
	}

	std::ifstream ifs(path, std::ios::in | std::ios::binary);
	if (!ifs.is_open()) {
		logger_->warn("ProgressFileOpenError", {{"path", path.string()}});
		return ProgressRecord{};
	}

	const std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

	try {
		ProgressRecord record = decode(content);
		logger_->info("ProgressRestored",
			      {{"path", path.string()},
			       {"lastSeenTimestamp", fmt::format("{}", record.lastSeenTimestamp)},
			       {"chunksAcquired", std::to_string(record.chunksAcquired)}});
		return record;
	} catch (const StateCorruptionError &e) {
		logger_->warn("ProgressFileCorrupted", {{"path", path.string()}, {"exception", e.what()}});
		return ProgressRecord{};
	}
}

void ProgressStore::save(const std::filesystem::path &path, const ProgressRecord &record) const
{
	const nlohmann::json j = record;

	std::filesystem::path tmpPath = path;
	tmpPath += ".tmp";
	{
		std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc);
		if (!ofs.is_open()) {
			logger_->error("FileOpenError", {{"path", tmpPath.string()}});
			throw std::runtime_error("FileOpenError(ProgressStore::save)");
		}

		ofs << j.dump();

		ofs.close();
		if (ofs.fail()) {
			logger_->error("FileWriteError", {{"path", tmpPath.string()}});
			throw std::runtime_error("FileWriteError(ProgressStore::save)");
		}
	}

	std::filesystem::path bakPath = path;
	bakPath += ".bak";

	if (std::filesystem::is_regular_file(path)) {
		std::filesystem::copy_file(path, bakPath, std::filesystem::copy_options::overwrite_existing);
	}
	std::filesystem::rename(tmpPath, path);

	logger_->info("ProgressSaved", {{"path", path.string()},
					{"chunksAcquired", std::to_string(record.chunksAcquired)},
					{"state", j.dump()}});
}

} // namespace LiveVodArchiver::Acquisition
