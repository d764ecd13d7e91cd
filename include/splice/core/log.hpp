// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace splicer::core {

// Shared "splice" logger (stderr, colour). Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> log() noexcept;

void set_log_level(spdlog::level::level_enum level) noexcept;

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off")
[[nodiscard]] bool set_log_level(std::string_view name) noexcept;

} // namespace splicer::core
