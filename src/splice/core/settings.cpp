// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/settings.hpp>
#include <splice/core/log.hpp>
#include <splice/disk/error.hpp>
#include <spdlog/common.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace splicer::core {

namespace {

std::error_code invalid(std::string_view key, std::string_view why) {
    log()->error("settings: '{}' {}", key, why);
    return make_error_code(DownloadErrc::invalid_config);
}

// Reads an unsigned key into out when present
std::error_code read_unsigned(const nlohmann::json& j, const char* key, std::uint64_t min,
                              std::uint64_t max, std::uint64_t& out) {
    if (!j.contains(key)) return {};
    const auto& v = j[key];
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
        return invalid(key, "must be a non-negative integer");
    }
    const auto value = v.get<std::uint64_t>();
    if (value < min || value > max) {
        return invalid(key, "is out of range");
    }
    out = value;
    return {};
}

} // namespace

std::expected<Settings, std::error_code>
parse_settings(std::string_view json_text, Settings base) noexcept {
    try {
        const auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(invalid("<root>", "must be an object"));
        }

        Settings s = std::move(base);
        DownloadConfig& c = s.download;
        std::uint64_t value = 0;

        value = c.segments;
        if (auto ec = read_unsigned(j, "segments", MIN_SEGMENTS, MAX_SEGMENTS, value)) {
            return std::unexpected(ec);
        }
        c.segments = static_cast<std::uint32_t>(value);

        value = c.max_retries;
        if (auto ec = read_unsigned(j, "max_retries", 0, 100, value)) return std::unexpected(ec);
        c.max_retries = static_cast<std::uint32_t>(value);

        value = static_cast<std::uint64_t>(c.retry_backoff.count());
        if (auto ec = read_unsigned(j, "retry_backoff_ms", 0, 3'600'000, value)) return std::unexpected(ec);
        c.retry_backoff = std::chrono::milliseconds(value);

        value = static_cast<std::uint64_t>(c.progress_interval.count());
        if (auto ec = read_unsigned(j, "progress_interval_ms", 1, 60'000, value)) return std::unexpected(ec);
        c.progress_interval = std::chrono::milliseconds(value);

        value = c.single_segment_threshold;
        if (auto ec = read_unsigned(j, "single_segment_threshold", MAX_SEGMENTS,
                                    std::numeric_limits<std::uint64_t>::max(), value)) {
            return std::unexpected(ec);
        }
        c.single_segment_threshold = value;

        value = c.connect_timeout_sec;
        if (auto ec = read_unsigned(j, "connect_timeout_sec", 1, 3600, value)) return std::unexpected(ec);
        c.connect_timeout_sec = static_cast<std::uint32_t>(value);

        value = c.stall_timeout_sec;
        if (auto ec = read_unsigned(j, "stall_timeout_sec", 1, 3600, value)) return std::unexpected(ec);
        c.stall_timeout_sec = static_cast<std::uint32_t>(value);

        if (j.contains("user_agent")) {
            if (!j["user_agent"].is_string()) {
                return std::unexpected(invalid("user_agent", "must be a string"));
            }
            c.user_agent = j["user_agent"].get<std::string>();
        }

        if (j.contains("log_level")) {
            if (!j["log_level"].is_string()) {
                return std::unexpected(invalid("log_level", "must be a string"));
            }
            auto level = j["log_level"].get<std::string>();
            if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
                return std::unexpected(invalid("log_level", "is not a known level"));
            }
            s.log_level = std::move(level);
        }

        return s;
    } catch (const nlohmann::json::exception& e) {
        log()->error("settings: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<Settings, std::error_code>
load_settings(const std::filesystem::path& path, Settings base) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(disk::errno_to_error_code(errno, disk::DiskErrc::file_not_found));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    log()->debug("loading settings from {}", path.string());
    return parse_settings(buffer.str(), std::move(base));
}

std::filesystem::path default_settings_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "splice" / "config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "splice" / "config.json";
    }
    return std::filesystem::path("splice.json");
}

std::string settings_to_json(const Settings& settings) {
    const DownloadConfig& c = settings.download;
    nlohmann::json j;
    j["segments"] = c.segments;
    j["max_retries"] = c.max_retries;
    j["retry_backoff_ms"] = c.retry_backoff.count();
    j["progress_interval_ms"] = c.progress_interval.count();
    j["single_segment_threshold"] = c.single_segment_threshold;
    j["connect_timeout_sec"] = c.connect_timeout_sec;
    j["stall_timeout_sec"] = c.stall_timeout_sec;
    j["user_agent"] = c.user_agent;
    j["log_level"] = settings.log_level;
    return j.dump(2);
}

} // namespace splicer::core
