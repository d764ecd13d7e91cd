// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/config.hpp>
#include <splice/core/error.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace splicer::core {

// Everything the JSON settings file can hold
struct Settings {
    DownloadConfig download;
    std::string log_level{"info"};
};

// Parse settings JSON on top of base. Unknown keys are ignored;
// a wrong type or out-of-range value is DownloadErrc::invalid_config.
[[nodiscard]] std::expected<Settings, std::error_code>
parse_settings(std::string_view json_text, Settings base = {}) noexcept;

// Load from file. A missing file is an error here; callers decide.
[[nodiscard]] std::expected<Settings, std::error_code>
load_settings(const std::filesystem::path& path, Settings base = {}) noexcept;

// $XDG_CONFIG_HOME/splice/config.json, else ~/.config/splice/config.json
[[nodiscard]] std::filesystem::path default_settings_path();

[[nodiscard]] std::string settings_to_json(const Settings& settings);

} // namespace splicer::core
