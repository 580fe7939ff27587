#pragma once

#include <segdl/downloader/downloader.hpp>

#include <filesystem>

namespace segdl::config {

/// Built-in defaults (user agent "segdl/<version>").
downloader::DownloaderConfig defaultDownloaderConfig();

/// Overlay the [downloader] section of a config file. A missing file leaves cfg unchanged.
void applyConfigFile(downloader::DownloaderConfig& cfg, const std::filesystem::path& path);

/// Overlay SEGDL_CONCURRENCY, SEGDL_RETRY, SEGDL_TIMEOUT_MS, SEGDL_PROXY,
/// SEGDL_RATE_LIMIT and SEGDL_TLS_INSECURE.
void applyEnvironment(downloader::DownloaderConfig& cfg);

/// defaults < config file < environment. CLI flags are applied by the caller.
downloader::DownloaderConfig loadDownloaderConfig(const std::filesystem::path& configPath);

} // namespace segdl::config
