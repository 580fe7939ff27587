/*
 * segdl/src/downloader/http_headers.cpp
 *
 * Header-line parsing for the transport. Only the headers the engine needs are
 * understood: Content-Length, Accept-Ranges and Content-Range.
 */

#include <segdl/downloader/http_headers.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <system_error>

namespace segdl::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    sv = trim(sv);
    if (sv.empty())
        return std::nullopt;
    std::uint64_t tmp{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return tmp;
}

} // namespace

bool applyHeaderLine(ResponseHead& head, std::string_view line) {
    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return false;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        head.acceptRangesBytes = (to_lower(val) == "bytes");
        return true;
    }
    if (key == "content-length") {
        head.contentLength = parse_u64(val);
        return true;
    }
    if (key == "content-range") {
        head.contentRangeTotal = parseContentRangeTotal(val);
        return true;
    }
    return false;
}

std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value) {
    value = trim(value);
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto unit = to_lower(trim(value.substr(0, std::min<std::size_t>(5, value.size()))));
    if (unit != "bytes")
        return std::nullopt;
    return parse_u64(value.substr(slash + 1));
}

std::string formatRangeHeader(const ByteRange& range) {
    std::string out = "bytes=" + std::to_string(range.first) + "-";
    if (range.last) {
        out += std::to_string(*range.last);
    }
    return out;
}

} // namespace segdl::downloader
