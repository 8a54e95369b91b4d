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

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <LiveVodArchiver/Logger/ILogger.hpp>
#include <LiveVodArchiver/Logger/NullLogger.hpp>

namespace LiveVodArchiver::Tools {

struct ProcessResult {
	int exitStatus = -1;
	std::string stdoutText;

	bool succeeded() const noexcept { return exitStatus == 0; }
};

class IProcessRunner {
public:
	IProcessRunner() noexcept = default;
	virtual ~IProcessRunner() = default;

	IProcessRunner(const IProcessRunner &) = delete;
	IProcessRunner &operator=(const IProcessRunner &) = delete;
	IProcessRunner(IProcessRunner &&) = delete;
	IProcessRunner &operator=(IProcessRunner &&) = delete;

	/**
	 * Runs argv[0] with the remaining arguments and waits for it to exit. Standard
	 * error is inherited from this process.
	 *
	 * @throws std::runtime_error when the process cannot be started.
	 */
	virtual ProcessResult run(const std::vector<std::string> &argv) = 0;
};

class PopenProcessRunner final : public IProcessRunner {
public:
	PopenProcessRunner() = default;
	~PopenProcessRunner() noexcept override = default;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger) { logger_ = std::move(logger); }

	ProcessResult run(const std::vector<std::string> &argv) override;

	static std::string shellQuote(std::string_view arg);
	static std::string buildCommandLine(const std::vector<std::string> &argv);

private:
	std::shared_ptr<const Logger::ILogger> logger_{Logger::NullLogger::instance()};
};

} // namespace LiveVodArchiver::Tools
