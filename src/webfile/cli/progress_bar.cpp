// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/cli/progress_bar.hpp>
#include <webfile/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace webfile::cli {

namespace {

constexpr auto REDRAW_INTERVAL = std::chrono::milliseconds(100);
constexpr int BAR_WIDTH = 30;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

ProgressBar::ProgressBar(std::string_view label, Unit unit)
    : label_(label)
    , unit_(unit)
    , started_(std::chrono::steady_clock::now()) {}

bool ProgressBar::enabled(bool quiet) noexcept {
    if (quiet) return false;
    if (::isatty(STDERR_FILENO) == 0) return false;
    return core::log_level() <= spdlog::level::info;
}

void ProgressBar::update(std::uint64_t current, std::optional<std::uint64_t> total) noexcept {
    if (finished_) return;

    current_ = current;
    total_ = total;

    const auto now = std::chrono::steady_clock::now();
    const bool complete = total && current >= *total;
    if (drawn_ && !complete && now - last_drawn_at_ < REDRAW_INTERVAL) return;

    last_drawn_at_ = now;
    drawn_ = true;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_).count();
    const std::uint64_t speed = elapsed > 0 && unit_ == Unit::bytes
        ? static_cast<std::uint64_t>(static_cast<double>(current) * 1000.0 / static_cast<double>(elapsed))
        : 0;

    try {
        std::cerr << "\r" << render(current, total, speed) << "\x1b[K" << std::flush;
    } catch (const std::exception&) {
        drawn_ = false;
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (drawn_) {
        // Force the final state on screen
        last_drawn_at_ = {};
        update(total_.value_or(current_), total_ ? total_ : std::optional<std::uint64_t>(current_));
        std::cerr << std::endl;
    }
    finished_ = true;
}

void ProgressBar::clear() noexcept {
    if (drawn_) {
        std::cerr << "\r\x1b[K" << std::flush;
    }
}

std::string ProgressBar::render(std::uint64_t current,
                                std::optional<std::uint64_t> total,
                                std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total && *total > 0) {
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(*total);
        percent = std::clamp(percent, 0.0, 100.0);

        line += render_bar(percent);
        line += " ";
        // Format percentage with padding
        const int pct_int = static_cast<int>(percent);
        if (pct_int < 10) line += " ";
        if (pct_int < 100) line += " ";
        line += std::to_string(pct_int) + "%";

        line += " (";
        line += format_count(current);
        line += "/";
        line += format_count(*total);
        line += ")";
    } else {
        line += format_count(current);
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        // ETA
        if (total && *total > current) {
            line += " ETA: ";
            line += format_time((*total - current) / speed_bps);
        }
    }
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (empty > 0) {
        bar += '>';
        bar.append(static_cast<std::size_t>(empty - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_count(std::uint64_t count) const {
    return unit_ == Unit::bytes ? format_bytes(count) : std::to_string(count);
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    if (bytes >= GB) return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    if (bytes >= MB) return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace webfile::cli
