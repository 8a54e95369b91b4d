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

#include "ProcessRunner.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <sys/wait.h>

namespace LiveVodArchiver::Tools {

namespace {

struct PipeCloser {
	void operator()(std::FILE *pipe) const noexcept { pclose(pipe); }
};

using unique_pipe_t = std::unique_ptr<std::FILE, PipeCloser>;

} // anonymous namespace

std::string PopenProcessRunner::shellQuote(std::string_view arg)
{
	std::string quoted;
	quoted.reserve(arg.size() + 2);
	quoted += '\'';
	for (const char c : arg) {
		if (c == '\'') {
			quoted += "'\\''";
		} else {
			quoted += c;
		}
	}
	quoted += '\'';
	return quoted;
}

std::string PopenProcessRunner::buildCommandLine(const std::vector<std::string> &argv)
{
	std::string commandLine;
	for (const auto &arg : argv) {
		if (!commandLine.empty()) {
			commandLine += ' ';
		}
		commandLine += shellQuote(arg);
	}
	return commandLine;
}

ProcessResult PopenProcessRunner::run(const std::vector<std::string> &argv)
{
	if (argv.empty() || argv.front().empty()) {
		throw std::invalid_argument("EmptyCommandError(PopenProcessRunner::run)");
	}

	const std::string commandLine = buildCommandLine(argv);
	logger_->debug("ProcessStarting", {{"command", commandLine}});

	std::fflush(nullptr);
	unique_pipe_t pipe(popen(commandLine.c_str(), "r"));
	if (!pipe) {
		logger_->error("ProcessSpawnError", {{"command", argv.front()}});
		throw std::runtime_error("ProcessSpawnError(PopenProcessRunner::run)");
	}

	ProcessResult result;
	std::array<char, 4096> buffer;
	std::size_t bytesRead = 0;
	while ((bytesRead = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
		result.stdoutText.append(buffer.data(), bytesRead);
	}

	const int status = pclose(pipe.release());
	if (status == -1) {
		logger_->error("ProcessWaitError", {{"command", argv.front()}});
		throw std::runtime_error("ProcessWaitError(PopenProcessRunner::run)");
	}

	result.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

	logger_->debug("ProcessExited", {{"command", argv.front()},
					 {"exitStatus", std::to_string(result.exitStatus)},
					 {"stdoutBytes", std::to_string(result.stdoutText.size())}});

	return result;
}

} // namespace LiveVodArchiver::Tools
