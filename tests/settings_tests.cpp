// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/settings.hpp>
#include "support/temp_dir.hpp"
#include <cstdlib>

using namespace splicer::core;
using namespace splicer::test;
using namespace std::chrono_literals;

TEST_CASE("Empty object keeps defaults", "[settings]") {
    auto s = parse_settings("{}");
    REQUIRE(s.has_value());
    CHECK(s->download.segments == DEFAULT_SEGMENTS);
    CHECK(s->download.max_retries == RETRY_COUNT);
    CHECK(s->download.retry_backoff == RETRY_BACKOFF);
    CHECK(s->download.user_agent == USER_AGENT);
    CHECK(s->log_level == "info");
}

TEST_CASE("All keys are read", "[settings]") {
    auto s = parse_settings(R"({
        "segments": 8,
        "max_retries": 5,
        "retry_backoff_ms": 250,
        "progress_interval_ms": 100,
        "single_segment_threshold": 2048,
        "connect_timeout_sec": 10,
        "stall_timeout_sec": 20,
        "user_agent": "test-agent/1.0",
        "log_level": "debug",
        "unknown_key": true
    })");
    REQUIRE(s.has_value());
    const auto& c = s->download;
    CHECK(c.segments == 8);
    CHECK(c.max_retries == 5);
    CHECK(c.retry_backoff == 250ms);
    CHECK(c.progress_interval == 100ms);
    CHECK(c.single_segment_threshold == 2048);
    CHECK(c.connect_timeout_sec == 10);
    CHECK(c.stall_timeout_sec == 20);
    CHECK(c.user_agent == "test-agent/1.0");
    CHECK(s->log_level == "debug");
}

TEST_CASE("Invalid settings are rejected", "[settings]") {
    auto rejected = [](std::string_view json) {
        auto s = parse_settings(json);
        return !s.has_value() && s.error() == DownloadErrc::invalid_config;
    };

    CHECK(rejected("not json"));
    CHECK(rejected("[1, 2]"));
    CHECK(rejected(R"({"segments": 0})"));
    CHECK(rejected(R"({"segments": 17})"));
    CHECK(rejected(R"({"segments": -2})"));
    CHECK(rejected(R"({"segments": "four"})"));
    CHECK(rejected(R"({"progress_interval_ms": 0})"));
    CHECK(rejected(R"({"single_segment_threshold": 0})"));
    CHECK(rejected(R"({"single_segment_threshold": 15})"));
    CHECK(rejected(R"({"user_agent": 5})"));
    CHECK(rejected(R"({"log_level": "loud"})"));
}

TEST_CASE("Smallest split threshold", "[settings]") {
    auto s = parse_settings(R"({"single_segment_threshold": 16})");
    REQUIRE(s.has_value());
    CHECK(s->download.single_segment_threshold == MAX_SEGMENTS);
}

TEST_CASE("Base settings are layered", "[settings]") {
    Settings base;
    base.download.segments = 12;
    auto s = parse_settings(R"({"max_retries": 1})", base);
    REQUIRE(s.has_value());
    CHECK(s->download.segments == 12);
    CHECK(s->download.max_retries == 1);
}

TEST_CASE("Settings file round trip", "[settings]") {
    TempDir dir;
    Settings saved;
    saved.download.segments = 6;
    saved.log_level = "warn";
    write_file(dir / "config.json", settings_to_json(saved));

    auto loaded = load_settings(dir / "config.json");
    REQUIRE(loaded.has_value());
    CHECK(loaded->download.segments == 6);
    CHECK(loaded->log_level == "warn");

    auto missing = load_settings(dir / "absent.json");
    CHECK_FALSE(missing.has_value());
}

TEST_CASE("Default settings path", "[settings]") {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_settings_path() == std::filesystem::path("/tmp/xdg-test/splice/config.json"));

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/tester", 1);
    CHECK(default_settings_path() == std::filesystem::path("/home/tester/.config/splice/config.json"));
}
