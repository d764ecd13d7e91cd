// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace splicer::cli {

// Minimal progress bar for CLI; falls back to a spinner when the total is unknown
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total = 0, std::string_view label = {});

    // Update progress
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Finish the progress bar
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // One status line, without the leading carriage return
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(double percent) const;

    std::uint64_t total_{0};
    std::uint64_t last_current_{0};
    int last_percent_{-1};
    std::size_t frame_{0};
    std::size_t last_width_{0};
    std::string label_;
    bool finished_{false};
};

} // namespace splicer::cli
