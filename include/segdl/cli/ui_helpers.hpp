#pragma once

// Shared CLI UI helper utilities for segdl
// - TTY detection and ANSI color enablement (NO_COLOR, TERM=dumb)
// - Byte and percentage formatting
// - Progress bar and spinner frames
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace segdl::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* YELLOW = "\x1b[33m";
    static constexpr const char* CYAN = "\x1b[36m";
};

// Basic TTY detection on stdout
inline bool stdout_is_tty() {
    return ::isatty(::fileno(stdout)) != 0;
}

inline bool colors_enabled() {
    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline std::string colorize(std::string_view s, const char* code) {
    if (!colors_enabled() || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 16);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

// Helper for formatting byte sizes in human-readable form
inline std::string format_bytes(std::uint64_t bytes, int precision = 1) {
    if (bytes == 0)
        return "0 B";

    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    int unit_idx = 0;

    while (value >= 1024.0 && unit_idx < 5) {
        value /= 1024.0;
        ++unit_idx;
    }

    std::ostringstream oss;
    if (unit_idx == 0) {
        oss << bytes << " B";
    } else {
        int prec = (value < 10.0) ? precision : 0;
        oss << std::fixed << std::setprecision(prec) << value << " " << units[unit_idx];
    }
    return oss.str();
}

// Progress bar: "[=====     ]  50%"
inline std::string progress_bar(double fraction, int width = 30, bool show_percentage = true) {
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const int filled = static_cast<int>(std::llround(clamped * static_cast<double>(width)));

    std::string bar = "[";
    bar.append(static_cast<size_t>(filled), '=');
    bar.append(static_cast<size_t>(width - filled), ' ');
    bar += "]";

    if (show_percentage) {
        std::ostringstream oss;
        oss << " " << std::setw(3) << static_cast<int>(clamped * 100.0) << "%";
        bar += oss.str();
    }

    const char* color = clamped >= 1.0 ? Ansi::GREEN : Ansi::CYAN;
    return colorize(bar, color);
}

// Spinner frames for progress indication
struct Spinner {
    static constexpr const char* FRAMES[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    static constexpr size_t FRAME_COUNT = 10;

    static const char* frame(size_t index) { return FRAMES[index % FRAME_COUNT]; }
};

} // namespace segdl::cli::ui
