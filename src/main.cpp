/*
 * Live VOD Archiver - Command Line Tool
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

#include <cstdio>
#include <exception>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

#include <LiveVodArchiver/App/ArchiverConfig.hpp>
#include <LiveVodArchiver/App/CommandLine.hpp>
#include <LiveVodArchiver/App/Commands.hpp>
#include <LiveVodArchiver/Logger/PrintLogger.hpp>

using namespace LiveVodArchiver;

namespace {

class CurlGlobalGuard {
public:
	CurlGlobalGuard()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
			throw std::runtime_error("CurlGlobalInitError(CurlGlobalGuard)");
	}
	~CurlGlobalGuard() noexcept { curl_global_cleanup(); }

	CurlGlobalGuard(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
};

} // anonymous namespace

int main(int argc, char **argv)
{
	std::vector<std::string_view> args(argv + 1, argv + argc);

	App::CommandLineOptions options;
	try {
		options = App::parseCommandLine(std::span<const std::string_view>(args));
	} catch (const App::UsageError &e) {
		fmt::print(stderr, "live-vod-archiver: {}\n\n{}", e.what(), App::usageText());
		return App::kExitUsage;
	}

	if (options.mode == App::CommandMode::Help) {
		fmt::print("{}", App::usageText());
		return App::kExitOk;
	}

	auto bootstrapLogger = std::make_shared<const Logger::PrintLogger>(
		options.verbose ? Logger::LogLevel::Debug : Logger::LogLevel::Info);

	try {
		App::ArchiverConfig config;
		if (options.configPath) {
			config = App::ArchiverConfig::load(*options.configPath, *bootstrapLogger);
		}
		App::applyOverrides(options, config);

		const auto level = Logger::PrintLogger::parseLevel(config.logLevel);
		if (!level) {
			bootstrapLogger->warn("UnknownLogLevel", {{"logLevel", config.logLevel}});
		}
		std::shared_ptr<const Logger::ILogger> logger =
			std::make_shared<const Logger::PrintLogger>(level.value_or(Logger::LogLevel::Info));

		CurlGlobalGuard curlGlobal;

		switch (options.mode) {
		case App::CommandMode::CheckReady:
			return App::runCheckReady(options, logger);
		case App::CommandMode::Slice:
			return App::runSlice(options, logger);
		default:
			return App::runPoll(config, logger);
		}
	} catch (const std::exception &e) {
		bootstrapLogger->error("UnhandledError", {{"exception", e.what()}});
		return App::kExitFailure;
	}
}
