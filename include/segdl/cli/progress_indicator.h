#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace segdl::cli {

/**
 * @brief Single-line transfer progress for the terminal
 *
 * Renders a bar (or percentage on a non-TTY) while the total is known and a
 * spinner with a byte count when it is not. update() may be called from
 * engine worker threads.
 */
class ProgressIndicator {
public:
    enum class Style {
        Spinner,    // ⠋ message (12.0 MB)
        Percentage, // [ 45%] message (12.0 MB/26.7 MB)
        Bar         // [=====     ]  45% message
    };

    explicit ProgressIndicator(Style style = Style::Bar);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void start(const std::string& message);

    /**
     * @brief Update progress in bytes
     * @param current Bytes written so far
     * @param total Expected size, absent when unknown
     */
    void update(std::uint64_t current, std::optional<std::uint64_t> total);

    /**
     * @brief Stop and clear the indicator line
     */
    void stop();

    bool isActive() const { return active_; }

    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }

    void setMessage(const std::string& message);

private:
    void render();

    Style style_;
    std::mutex mutex_;
    std::string message_;
    std::atomic<bool> active_{false};
    std::uint64_t current_ = 0;
    std::optional<std::uint64_t> total_;
    size_t spinnerIndex_ = 0;
    int updateIntervalMs_ = 100;

    std::chrono::steady_clock::time_point lastUpdate_;
};

} // namespace segdl::cli
