#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace segdl::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Unsigned integer; nullopt unless the whole (trimmed) string is digits
inline std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

// Decimal number such as "1.5"; nullopt unless the whole (trimmed) string parses
inline std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    double out = 0.0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

// Time parsing (milliseconds, no unit suffix)
inline std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto v = parse_u64(s);
    if (!v)
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*v));
}

// true/false, yes/no, on/off, 1/0 (case-insensitive)
std::optional<bool> parse_bool(std::string_view s);

// Byte counts with optional k/m/g suffix (binary multiples), e.g. "512k", "2M"
std::optional<std::uint64_t> parse_size(std::string_view s);

// Parse a value from TOML config file. Accepts "[section] key = v" and "section.key = v".
// Returns "" when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/segdl or ~/.config/segdl
std::filesystem::path get_config_dir();

/// Config file path: override, else SEGDL_CONFIG, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace segdl::config
