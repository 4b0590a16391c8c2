// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace surge::cli {

// One line per file: label, bar, percent, bytes sent, rate
class ProgressBar {
public:
    ProgressBar(std::uint64_t total_bytes, std::string_view label = {});

    // percent in 0..100
    void update(double percent) noexcept;

    // Draw the final state and end the line with `status`
    void finish(std::string_view status) noexcept;

    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);
    [[nodiscard]] static std::string render_bar(double percent, int width = 30);

private:
    void draw(double percent) noexcept;

    std::uint64_t total_{0};
    std::string label_;
    double last_percent_{-1.0};
    bool finished_{false};
    std::chrono::steady_clock::time_point started_;
};

// For server-side work with no measurable progress
class Spinner {
public:
    explicit Spinner(std::string_view label = {});

    void update() noexcept;
    void finish(std::string_view status) noexcept;

private:
    std::string label_;
    std::size_t frame_{0};
};

} // namespace surge::cli
