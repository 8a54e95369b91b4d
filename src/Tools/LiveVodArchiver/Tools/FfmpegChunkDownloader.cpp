/*
 * Live VOD Archiver - Tools Module
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

#include "FfmpegChunkDownloader.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <LiveVodArchiver/Acquisition/AcquisitionErrors.hpp>

namespace LiveVodArchiver::Tools {

using Acquisition::DownloadDispatchError;

namespace {

constexpr std::size_t kMaxFolderNameBytes = 240;
constexpr std::string_view kForbiddenFolderChars = "\\/*?:\"<>|";

void writeTextFile(const std::filesystem::path &path, std::string_view text)
{
	std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
	if (!ofs.is_open()) {
		throw DownloadDispatchError(fmt::format("DownloadDispatchError(writeTextFile):{}", path.string()));
	}
	ofs << text;
	ofs.close();
	if (ofs.fail()) {
		throw DownloadDispatchError(fmt::format("DownloadDispatchError(writeTextFile):{}", path.string()));
	}
}

} // anonymous namespace

FfmpegChunkDownloader::FfmpegChunkDownloader(std::shared_ptr<IProcessRunner> runner, FfmpegOptions options)
	: runner_(std::move(runner)),
	  options_(std::move(options))
{
	if (!runner_) {
		throw std::invalid_argument("RunnerIsNullError(FfmpegChunkDownloader::FfmpegChunkDownloader)");
	}
	if (options_.executable.empty()) {
		throw std::invalid_argument("ExecutableIsEmptyError(FfmpegChunkDownloader::FfmpegChunkDownloader)");
	}
}

FfmpegChunkDownloader::~FfmpegChunkDownloader() noexcept = default;

std::string FfmpegChunkDownloader::sanitizeFolderName(std::string_view title)
{
	std::string cleaned;
	cleaned.reserve(title.size());
	for (const char c : title) {
		if (kForbiddenFolderChars.find(c) == std::string_view::npos) {
			cleaned += c;
		}
	}

	const auto first = cleaned.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return "Untitled";
	}
	const auto last = cleaned.find_last_not_of(" \t\r\n");
	cleaned = cleaned.substr(first, last - first + 1);

	if (cleaned.size() > kMaxFolderNameBytes) {
		std::size_t cut = kMaxFolderNameBytes;
		// Do not split a UTF-8 sequence.
		while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80) {
			--cut;
		}
		cleaned.resize(cut);
	}

	return cleaned;
}

std::string FfmpegChunkDownloader::chunkBaseName(int chunkIndex)
{
	return fmt::format("chunk_{:03d}", chunkIndex);
}

bool FfmpegChunkDownloader::dispatch(const std::string &manifestText,
				     const Acquisition::ChunkDestination &destination)
{
	const std::filesystem::path outputDir =
		options_.downloadDir / sanitizeFolderName(destination.recordingTitle);

	std::error_code ec;
	std::filesystem::create_directories(outputDir, ec);
	if (ec) {
		logger_->error("OutputDirectoryCreateError", {{"path", outputDir.string()}, {"error", ec.message()}});
		throw DownloadDispatchError(
			fmt::format("DownloadDispatchError(FfmpegChunkDownloader::dispatch):{}", ec.message()));
	}

	const std::string baseName = chunkBaseName(destination.chunkIndex);
	const std::filesystem::path manifestPath = outputDir / (baseName + ".m3u8");
	const std::filesystem::path outputPath = outputDir / (baseName + ".mp4");
	std::filesystem::path partPath = outputPath;
	partPath += ".part";

	writeTextFile(manifestPath, manifestText);

	const std::filesystem::path metadataPath = outputDir / "metadata.md";
	if (!std::filesystem::exists(metadataPath, ec)) {
		writeTextFile(metadataPath, fmt::format("```\nSource: {}\nTitle: {}\n```\n", destination.sourceUrl,
							destination.recordingTitle));
	}

	logger_->info("ChunkDownloadStarting", {{"manifest", manifestPath.string()},
						{"output", outputPath.string()},
						{"startMinute", std::to_string(destination.window.startMinute)}});

	const std::vector<std::string> argv{options_.executable,
					    "-hide_banner",
					    "-loglevel",
					    "error",
					    "-y",
					    "-protocol_whitelist",
					    "file,http,https,tcp,tls,crypto",
					    "-i",
					    manifestPath.string(),
					    "-c",
					    "copy",
					    "-f",
					    "mp4",
					    partPath.string()};

	ProcessResult result;
	try {
		result = runner_->run(argv);
	} catch (const std::runtime_error &e) {
		throw DownloadDispatchError(
			fmt::format("DownloadDispatchError(FfmpegChunkDownloader::dispatch):{}", e.what()));
	}

	if (!result.succeeded() || !std::filesystem::is_regular_file(partPath, ec)) {
		logger_->error("FfmpegRemuxError",
			       {{"output", outputPath.string()}, {"exitStatus", std::to_string(result.exitStatus)}});
		std::filesystem::remove(partPath, ec);
		return false;
	}

	std::filesystem::rename(partPath, outputPath, ec);
	if (ec) {
		logger_->error("OutputRenameError", {{"output", outputPath.string()}, {"error", ec.message()}});
		return false;
	}

	logger_->info("ChunkDownloaded", {{"output", outputPath.string()}});
	return true;
}

} // namespace LiveVodArchiver::Tools
