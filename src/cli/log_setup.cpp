#include <segdl/cli/cmd_get.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace segdl::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void configureLogging(bool verbose, bool quiet) {
    // Precedence: env SEGDL_LOG_LEVEL > --quiet > --verbose > warn
    if (const char* envLvl = std::getenv("SEGDL_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown SEGDL_LOG_LEVEL '{}'", envLvl);
    }
    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace segdl::cli
