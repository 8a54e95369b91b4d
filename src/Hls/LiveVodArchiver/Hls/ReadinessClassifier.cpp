/*
 * Live VOD Archiver - Hls Module
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

#include "ReadinessClassifier.hpp"

#include <stdexcept>

#include "HlsTypes.hpp"
#include "PlaylistLines.hpp"

namespace LiveVodArchiver::Hls {

ReadinessClassifier::ReadinessClassifier(std::shared_ptr<IPlaylistFetcher> fetcher) : fetcher_(std::move(fetcher))
{
	if (!fetcher_) {
		throw std::invalid_argument("FetcherIsNullError(ReadinessClassifier::ReadinessClassifier)");
	}
}

ReadinessClassifier::~ReadinessClassifier() noexcept = default;

bool ReadinessClassifier::isFinalized(const std::string &manifestUrl) const
{
	const std::string rawText = fetcher_->fetch(manifestUrl);
	const bool finalized = containsEndList(rawText);
	if (finalized) {
		logger_->info("RecordingFinalized", {{"manifestUrl", manifestUrl}});
	} else {
		logger_->info("RecordingNotFinalized", {{"manifestUrl", manifestUrl}});
	}
	return finalized;
}

bool ReadinessClassifier::containsEndList(std::string_view rawText)
{
	for (const std::string_view line : splitLines(rawText)) {
		if (trimLine(line).starts_with(kEndListTag)) {
			return true;
		}
	}
	return false;
}

} // namespace LiveVodArchiver::Hls
