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

#include <optional>
#include <string>

#include "RecordingIdentity.hpp"

namespace LiveVodArchiver::Acquisition {

class IVideoMetadataProvider {
public:
	IVideoMetadataProvider() noexcept = default;
	virtual ~IVideoMetadataProvider() = default;

	IVideoMetadataProvider(const IVideoMetadataProvider &) = delete;
	IVideoMetadataProvider &operator=(const IVideoMetadataProvider &) = delete;
	IVideoMetadataProvider(IVideoMetadataProvider &&) = delete;
	IVideoMetadataProvider &operator=(IVideoMetadataProvider &&) = delete;

	/**
	 * Latest recording of the monitored channel, or std::nullopt when none can be found.
	 *
	 * @throws DiscoveryError when the platform cannot be queried.
	 */
	virtual std::optional<RecordingIdentity> discoverLatest(const std::string &channelTarget) = 0;

	/**
	 * URL of the HLS media playlist behind the recording.
	 *
	 * @throws DiscoveryError when the playlist URL cannot be resolved.
	 */
	virtual std::string resolveManifestUrl(const RecordingIdentity &identity) = 0;
};

} // namespace LiveVodArchiver::Acquisition
