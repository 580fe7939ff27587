#pragma once

#include <segdl/downloader/downloader.hpp>

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>

namespace CLI {
class App;
}

namespace segdl::cli {

// Exit codes of `segdl get`
inline constexpr int kExitCompleted = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitPaused = 2;

/// Registers the `get` subcommand. A non-zero exit is reported by throwing CLI::RuntimeError.
void registerGetCommand(CLI::App& app);

/// trace|debug|info|warn|error|critical|off (case-insensitive, a few aliases)
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view s);

/// SEGDL_LOG_LEVEL > --quiet > --verbose > warn
void configureLogging(bool verbose, bool quiet);

/// Last non-empty path segment of the URL (query and fragment stripped), else "download.bin".
std::string defaultOutputName(std::string_view url);

/// "Name: value" -> Header; nullopt when there is no colon or the name is empty.
std::optional<downloader::Header> parseHeaderArg(std::string_view raw);

} // namespace segdl::cli
