// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace splicer::core {

constexpr std::uint32_t MAX_SEGMENTS = 16;
constexpr std::uint32_t MIN_SEGMENTS = 1;
constexpr std::uint32_t DEFAULT_SEGMENTS = 4;
constexpr std::uint64_t SINGLE_SEGMENT_THRESHOLD = 1024 * 1024;    // 1 MiB, at or below: one stream

constexpr std::size_t CHUNK_SIZE = 8 * 1024;                       // pause/cancel checkpoint granularity
constexpr std::size_t MERGE_BUFFER_SIZE = 256 * 1024;              // 256 KB

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_BACKOFF{2000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr const char* USER_AGENT = "Splice Download Manager";

// Runtime knobs for one download; defaults mirror the constants above
struct DownloadConfig {
    std::uint32_t segments{DEFAULT_SEGMENTS};
    std::uint32_t max_retries{RETRY_COUNT};
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::uint64_t single_segment_threshold{SINGLE_SEGMENT_THRESHOLD};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::string user_agent{USER_AGENT};
};

} // namespace splicer::core
