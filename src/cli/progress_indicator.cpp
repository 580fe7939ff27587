#include <iomanip>
#include <iostream>
#include <sstream>
#include <segdl/cli/progress_indicator.h>
#include <segdl/cli/ui_helpers.hpp>

namespace segdl::cli {

ProgressIndicator::ProgressIndicator(Style style) : style_(style) {}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::start(const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (active_)
        return;

    message_ = message;
    active_ = true;
    current_ = 0;
    total_.reset();
    spinnerIndex_ = 0;
    lastUpdate_ = std::chrono::steady_clock::now();

    render();
}

void ProgressIndicator::update(std::uint64_t current, std::optional<std::uint64_t> total) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!active_)
        return;

    current_ = current;
    total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();

    // Always draw the final frame
    const bool done = total_ && current_ >= *total_;
    if (elapsed >= updateIntervalMs_ || done) {
        ++spinnerIndex_;
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::setMessage(const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex_);
    message_ = message;
    render();
}

void ProgressIndicator::stop() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!active_)
        return;

    // Clear the line
    if (ui::stdout_is_tty()) {
        std::cout << "\r\033[K" << std::flush;
    } else {
        std::cout << "\n" << std::flush;
    }
    active_ = false;
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    std::ostringstream oss;
    const bool isTty = ui::stdout_is_tty();
    oss << (isTty ? "\r\033[K" : "\r");

    const bool known = total_ && *total_ > 0;
    auto counts = [&] {
        std::string s = " (" + ui::format_bytes(current_);
        if (known)
            s += "/" + ui::format_bytes(*total_);
        return s + ")";
    };

    if (!known || style_ == Style::Spinner) {
        oss << (isTty ? ui::Spinner::frame(spinnerIndex_) : "*") << " " << message_ << counts();
    } else {
        const double fraction = static_cast<double>(current_) / static_cast<double>(*total_);
        if (style_ == Style::Bar && isTty) {
            oss << ui::progress_bar(fraction, 30, true) << " " << message_ << counts();
        } else {
            const auto percent = static_cast<int>((current_ * 100) / *total_);
            oss << "[" << std::setw(3) << percent << "%] " << message_ << counts();
        }
    }

    std::cout << oss.str() << std::flush;
}

} // namespace segdl::cli
