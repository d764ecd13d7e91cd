// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace splicer::core {

namespace {

constexpr const char* LOGGER_NAME = "splice";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> log() noexcept {
    static const std::shared_ptr<spdlog::logger> logger = make_logger();
    return logger;
}

void set_log_level(spdlog::level::level_enum level) noexcept {
    log()->set_level(level);
}

bool set_log_level(std::string_view name) noexcept {
    const std::string level_name(name);
    auto level = spdlog::level::from_str(level_name);
    // from_str() answers "off" for anything it does not recognise
    if (level == spdlog::level::off && level_name != "off") {
        return false;
    }
    set_log_level(level);
    return true;
}

} // namespace splicer::core
