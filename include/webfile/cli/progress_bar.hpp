// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace webfile::cli {

// Single-line progress bar on stderr
class ProgressBar {
public:
    enum class Unit { bytes, items };

    explicit ProgressBar(std::string_view label = {}, Unit unit = Unit::bytes);

    // Redraw with the current count; totals may appear late or never
    void update(std::uint64_t current, std::optional<std::uint64_t> total) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] Unit unit() const noexcept { return unit_; }
    void unit(Unit u) noexcept { unit_ = u; }

    // Line as it would be drawn, without carriage return
    [[nodiscard]] std::string render(std::uint64_t current,
                                     std::optional<std::uint64_t> total,
                                     std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

    // Bars only make sense on a terminal at info level or below
    [[nodiscard]] static bool enabled(bool quiet) noexcept;

private:
    [[nodiscard]] static std::string render_bar(double percent);
    [[nodiscard]] std::string format_count(std::uint64_t count) const;

    std::string label_;
    Unit unit_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_drawn_at_;
    std::uint64_t current_{0};
    std::optional<std::uint64_t> total_;
    bool drawn_{false};
    bool finished_{false};
};

} // namespace webfile::cli
