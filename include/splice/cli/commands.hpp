// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/error.hpp>
#include <splice/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splicer::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_path;
    std::optional<std::uint32_t> segments;
    std::optional<std::uint32_t> retries;
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;      // non-empty: the command line was rejected
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings file (explicit or default) with command line overrides applied
[[nodiscard]] std::expected<core::Settings, std::error_code> resolve_settings(const CliArgs& args) noexcept;

// Download every URL in turn; 0 when all completed
[[nodiscard]] CliResult download_all(const CliArgs& args, const core::Settings& settings) noexcept;

// Ask SIGINT to cancel the running download
void install_interrupt_handler() noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

// Probe a URL without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::Settings& settings) noexcept;

} // namespace splicer::cli
