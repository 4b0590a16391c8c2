// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace surge::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total_bytes, std::string_view label)
    : total_(total_bytes)
    , label_(label)
    , started_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(double percent) noexcept {
    if (finished_) return;
    percent = std::clamp(percent, 0.0, 100.0);

    // Redraw on whole-percent steps only
    if (std::floor(percent) <= std::floor(last_percent_)) return;
    last_percent_ = percent;
    draw(percent);
}

void ProgressBar::finish(std::string_view status) noexcept {
    if (finished_) return;
    finished_ = true;
    draw(std::max(last_percent_, 0.0));
    std::cout << ' ' << status << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

void ProgressBar::draw(double percent) noexcept {
    try {
        const auto sent = static_cast<std::uint64_t>(static_cast<double>(total_) * percent / 100.0);
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            line += ": ";
        }
        line += render_bar(percent);

        const int pct = static_cast<int>(percent);
        line += pct < 10 ? "   " : pct < 100 ? "  " : " ";
        line += std::to_string(pct) + "%";

        line += " (" + format_bytes(sent) + "/" + format_bytes(total_) + ")";

        if (elapsed > 0.5 && sent > 0) {
            const auto bps = static_cast<std::uint64_t>(static_cast<double>(sent) / elapsed);
            line += " @ " + format_speed(bps);
            if (bps > 0 && sent < total_) {
                line += " ETA: " + format_time((total_ - sent) / bps);
            }
        }

        line += std::string(6, ' ');
        std::cout << line << std::flush;
    } catch (const std::exception&) {
        // Skip this frame
    }
}

std::string ProgressBar::render_bar(double percent, int width) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
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
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m " << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::string_view label)
    : label_(label) {}

void Spinner::update() noexcept {
    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << ' ' << label_ << std::flush;
    ++frame_;
}

void Spinner::finish(std::string_view status) noexcept {
    std::cout << "\r" << label_ << ' ' << status << std::string(4, ' ') << std::endl;
}

} // namespace surge::cli
