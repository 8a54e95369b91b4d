/*
 * Live VOD Archiver - Tools Module Tests
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

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <LiveVodArchiver/Tools/ProcessRunner.hpp>

using namespace LiveVodArchiver::Tools;

TEST(ProcessRunnerTest, ShellQuote)
{
	EXPECT_EQ(PopenProcessRunner::shellQuote("plain"), "'plain'");
	EXPECT_EQ(PopenProcessRunner::shellQuote(""), "''");
	EXPECT_EQ(PopenProcessRunner::shellQuote("it's"), "'it'\\''s'");
	EXPECT_EQ(PopenProcessRunner::shellQuote("$(rm -rf /); `x`"), "'$(rm -rf /); `x`'");
}

TEST(ProcessRunnerTest, BuildCommandLine)
{
	const std::vector<std::string> argv{"yt-dlp", "-f", "best[height<=480]", "https://a/b?c=d&e=f"};
	EXPECT_EQ(PopenProcessRunner::buildCommandLine(argv),
		  "'yt-dlp' '-f' 'best[height<=480]' 'https://a/b?c=d&e=f'");
}

TEST(ProcessRunnerTest, CapturesStdoutAndExitStatus)
{
	PopenProcessRunner runner;

	const ProcessResult echoed = runner.run({"printf", "%s\\n", "hello world"});
	EXPECT_TRUE(echoed.succeeded());
	EXPECT_EQ(echoed.stdoutText, "hello world\n");

	const ProcessResult failed = runner.run({"sh", "-c", "exit 3"});
	EXPECT_FALSE(failed.succeeded());
	EXPECT_EQ(failed.exitStatus, 3);
}

TEST(ProcessRunnerTest, ArgumentsAreNotInterpretedByTheShell)
{
	PopenProcessRunner runner;
	const ProcessResult result = runner.run({"printf", "%s", "$HOME;echo injected"});
	EXPECT_EQ(result.stdoutText, "$HOME;echo injected");
}

TEST(ProcessRunnerTest, EmptyCommandIsRejected)
{
	PopenProcessRunner runner;
	EXPECT_THROW(runner.run({}), std::invalid_argument);
}
