/*
 * Live VOD Archiver - App Module
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

#include "CommandLine.hpp"

#include <charconv>

#include <fmt/format.h>

namespace LiveVodArchiver::App {

namespace {

int parseInt(std::string_view flag, std::string_view value)
{
	int result = 0;
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (ec != std::errc() || ptr != value.data() + value.size()) {
		throw UsageError(fmt::format("{} expects an integer, got '{}'", flag, value));
	}
	return result;
}

} // anonymous namespace

CommandLineOptions parseCommandLine(std::span<const std::string_view> args)
{
	CommandLineOptions options;
	bool sawStart = false;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const std::string_view arg = args[i];

		auto nextValue = [&]() -> std::string_view {
			if (i + 1 >= args.size()) {
				throw UsageError(fmt::format("{} expects a value", arg));
			}
			return args[++i];
		};

		if (arg == "-h" || arg == "--help") {
			options.mode = CommandMode::Help;
		} else if (arg == "--config") {
			options.configPath = std::filesystem::path(nextValue());
		} else if (arg == "--channel_url") {
			options.channelTarget = std::string(nextValue());
		} else if (arg == "--memory_file") {
			options.memoryFilePath = std::string(nextValue());
		} else if (arg == "--chunk_size") {
			options.chunkSizeMinutes = parseInt(arg, nextValue());
			if (*options.chunkSizeMinutes <= 0) {
				throw UsageError("--chunk_size must be positive");
			}
		} else if (arg == "--download_dir") {
			options.downloadDir = std::string(nextValue());
		} else if (arg == "--cookies") {
			options.cookiesPath = std::string(nextValue());
		} else if (arg == "--format") {
			options.streamFormat = std::string(nextValue());
		} else if (arg == "--download") {
			options.download = true;
		} else if (arg == "-v" || arg == "--verbose") {
			options.verbose = true;
		} else if (arg == "--check-ready") {
			options.mode = CommandMode::CheckReady;
			options.manifestUrl = std::string(nextValue());
		} else if (arg == "--slice") {
			options.mode = CommandMode::Slice;
			options.manifestUrl = std::string(nextValue());
		} else if (arg == "--start") {
			options.startMinute = parseInt(arg, nextValue());
			if (options.startMinute < 0) {
				throw UsageError("--start must not be negative");
			}
			sawStart = true;
		} else if (arg == "--duration") {
			options.durationMinute = parseInt(arg, nextValue());
			if (*options.durationMinute <= 0) {
				throw UsageError("--duration must be positive");
			}
		} else {
			throw UsageError(fmt::format("unknown argument '{}'", arg));
		}
	}

	if (options.mode != CommandMode::Slice && (sawStart || options.durationMinute)) {
		throw UsageError("--start and --duration require --slice");
	}

	return options;
}

void applyOverrides(const CommandLineOptions &options, ArchiverConfig &config)
{
	if (options.channelTarget)
		config.acquisition.channelTarget = *options.channelTarget;
	if (options.memoryFilePath)
		config.acquisition.memoryFilePath = *options.memoryFilePath;
	if (options.chunkSizeMinutes)
		config.acquisition.chunkSizeMinutes = *options.chunkSizeMinutes;
	if (options.download)
		config.acquisition.dispatchEnabled = true;
	if (options.downloadDir)
		config.downloadDir = *options.downloadDir;
	if (options.cookiesPath)
		config.cookiesPath = *options.cookiesPath;
	if (options.streamFormat)
		config.streamFormat = *options.streamFormat;
	if (options.verbose)
		config.logLevel = "debug";
}

std::string usageText()
{
	return "Usage: live-vod-archiver [options]\n"
	       "\n"
	       "Polls a channel once and downloads the next chunk of its latest recording.\n"
	       "\n"
	       "Options:\n"
	       "  --config <path>          JSON configuration file\n"
	       "  --channel_url <url>      Channel to monitor\n"
	       "  --memory_file <path>     Progress state file (default: memory.json)\n"
	       "  --chunk_size <minutes>   Chunk size in minutes (default: 60)\n"
	       "  --download               Download the next chunk and update the state file\n"
	       "  --download_dir <path>    Root directory for downloaded chunks\n"
	       "  --cookies <path>         Cookies file passed to yt-dlp\n"
	       "  --format <selector>      yt-dlp format selector for the stream playlist\n"
	       "  --verbose                Debug logging\n"
	       "\n"
	       "Utilities:\n"
	       "  --check-ready <manifestUrl>\n"
	       "      Print whether the playlist is finalized\n"
	       "  --slice <manifestUrl> --start <minutes> [--duration <minutes>]\n"
	       "      Print the chunk playlist for a window; open-ended without --duration\n";
}

} // namespace LiveVodArchiver::App
