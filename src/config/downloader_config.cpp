#include <segdl/config/config_helpers.h>
#include <segdl/config/downloader_config.h>
#include <segdl/version.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <string>

namespace segdl::config {

using downloader::DownloaderConfig;

namespace {

constexpr const char* kSection = "downloader";

void setCount(int& target, const std::string& raw, const char* source, int minimum) {
    if (raw.empty())
        return;
    auto v = parse_u64(raw);
    if (!v || *v < static_cast<std::uint64_t>(minimum) ||
        *v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        spdlog::warn("Ignoring invalid {} '{}'", source, raw);
        return;
    }
    target = static_cast<int>(*v);
}

void setMs(std::chrono::milliseconds& target, const std::string& raw, const char* source) {
    if (raw.empty())
        return;
    auto v = parse_ms(raw);
    if (!v || v->count() == 0) {
        spdlog::warn("Ignoring invalid {} '{}'", source, raw);
        return;
    }
    target = *v;
}

void setBool(bool& target, const std::string& raw, const char* source) {
    if (raw.empty())
        return;
    auto v = parse_bool(raw);
    if (!v) {
        spdlog::warn("Ignoring invalid {} '{}'", source, raw);
        return;
    }
    target = *v;
}

void setRate(std::uint64_t& target, const std::string& raw, const char* source) {
    if (raw.empty())
        return;
    auto v = parse_size(raw);
    if (!v) {
        spdlog::warn("Ignoring invalid {} '{}'", source, raw);
        return;
    }
    target = *v;
}

// Backoff growth factor; below 1.0 the delay would shrink
void setMultiplier(double& target, const std::string& raw, const char* source) {
    if (raw.empty())
        return;
    auto v = parse_double(raw);
    if (!v || !(*v >= 1.0 && *v <= 100.0)) {
        spdlog::warn("Ignoring invalid {} '{}'", source, raw);
        return;
    }
    target = *v;
}

std::string env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

} // namespace

DownloaderConfig defaultDownloaderConfig() {
    DownloaderConfig cfg;
    cfg.http.userAgent = std::string("segdl/") + SEGDL_VERSION_STRING;
    return cfg;
}

void applyConfigFile(DownloaderConfig& cfg, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at {}", path.string());
        return;
    }
    spdlog::debug("Loading config from {}", path.string());

    auto value = [&](const char* key) { return parse_config_value(path, kSection, key); };

    setCount(cfg.defaultConcurrency, value("concurrency"), "downloader.concurrency", 1);
    setCount(cfg.retryCount, value("retry"), "downloader.retry", 0);
    setMs(cfg.http.timeout, value("timeout_ms"), "downloader.timeout_ms");
    setMs(cfg.http.connectTimeout, value("connect_timeout_ms"), "downloader.connect_timeout_ms");
    setBool(cfg.http.followRedirects, value("follow_redirects"), "downloader.follow_redirects");
    setBool(cfg.http.tls.insecure, value("tls_insecure"), "downloader.tls_insecure");
    setRate(cfg.rateLimitBps, value("rate_limit"), "downloader.rate_limit");
    setMs(cfg.retry.initialBackoff, value("retry_initial_backoff_ms"),
          "downloader.retry_initial_backoff_ms");
    setMs(cfg.retry.maxBackoff, value("retry_max_backoff_ms"), "downloader.retry_max_backoff_ms");
    setMultiplier(cfg.retry.multiplier, value("retry_multiplier"), "downloader.retry_multiplier");

    if (auto raw = value("buffer_size"); !raw.empty()) {
        auto v = parse_size(raw);
        if (!v || *v == 0) {
            spdlog::warn("Ignoring invalid downloader.buffer_size '{}'", raw);
        } else {
            cfg.http.bufferSize = static_cast<std::size_t>(*v);
        }
    }
    if (auto raw = value("user_agent"); !raw.empty())
        cfg.http.userAgent = raw;
    if (auto raw = value("proxy"); !raw.empty())
        cfg.http.proxy = raw;
    if (auto raw = value("tls_ca"); !raw.empty())
        cfg.http.tls.caPath = expand_tilde(raw).string();
}

void applyEnvironment(DownloaderConfig& cfg) {
    setCount(cfg.defaultConcurrency, env("SEGDL_CONCURRENCY"), "SEGDL_CONCURRENCY", 1);
    setCount(cfg.retryCount, env("SEGDL_RETRY"), "SEGDL_RETRY", 0);
    setMs(cfg.http.timeout, env("SEGDL_TIMEOUT_MS"), "SEGDL_TIMEOUT_MS");
    setRate(cfg.rateLimitBps, env("SEGDL_RATE_LIMIT"), "SEGDL_RATE_LIMIT");
    setBool(cfg.http.tls.insecure, env("SEGDL_TLS_INSECURE"), "SEGDL_TLS_INSECURE");
    if (auto proxy = env("SEGDL_PROXY"); !proxy.empty())
        cfg.http.proxy = proxy;
}

DownloaderConfig loadDownloaderConfig(const std::filesystem::path& configPath) {
    auto cfg = defaultDownloaderConfig();
    applyConfigFile(cfg, configPath);
    applyEnvironment(cfg);
    return cfg;
}

} // namespace segdl::config
