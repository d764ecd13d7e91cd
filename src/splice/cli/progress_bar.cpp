// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/cli/progress_bar.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace splicer::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr int BAR_WIDTH = 30;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ == 0) {
        // Unknown size: spinner and byte count
        line += SPINNER_FRAMES[frame_ % 4];
        line += ' ';
        line += format_bytes(current);
        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);
        }
        return line;
    }

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    line += render_bar(percent);
    line += fmt::format(" {:3d}%", static_cast<int>(percent));
    line += fmt::format(" ({}/{})", format_bytes(current), format_bytes(total_));

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        // ETA
        if (current < total_) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }
    return line;
}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (finished_) return;

    if (total_ > 0) {
        // Only redraw if significant progress (every 1%)
        const auto percent = static_cast<int>(std::min<std::uint64_t>(current * 100 / total_, 100));
        if (percent == last_percent_ && current != total_) return;
        last_percent_ = percent;
    } else {
        ++frame_;
    }
    last_current_ = current;

    std::string line = render(current, speed_bps);
    const std::size_t width = line.size();
    if (width < last_width_) {
        line += std::string(last_width_ - width, ' ');
    }
    last_width_ = width;

    std::cout << '\r' << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    if (total_ > 0) {
        last_percent_ = -1;
        update(total_, 0);
    } else {
        update(last_current_, 0);
    }
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() {
    std::cout << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) return fmt::format("{:.2f} TB", value / TB);
    if (bytes >= GB) return fmt::format("{:.2f} GB", value / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", value / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", value / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

} // namespace splicer::cli
