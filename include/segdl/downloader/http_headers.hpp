#pragma once

/*
 * HTTP response header helpers shared by the curl adapter and the tests.
 */

#include <segdl/downloader/downloader.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace segdl::downloader {

/**
 * Fold one raw header line ("Key: Value\r\n") into a ResponseHead.
 * Header names are case-insensitive; unknown headers and malformed lines are ignored.
 * Returns true when the line was recognized.
 */
bool applyHeaderLine(ResponseHead& head, std::string_view line);

/**
 * Total size from a Content-Range value ("bytes 0-0/12345"). Absent for "*" or malformed input.
 */
[[nodiscard]] std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value);

/**
 * Range header value for a byte range: "bytes=first-last" or "bytes=first-".
 */
[[nodiscard]] std::string formatRangeHeader(const ByteRange& range);

} // namespace segdl::downloader
