// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/config.hpp>
#include <splice/core/error.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace splicer::core {

using JobId = std::uint32_t;

// Job lifecycle
enum class DownloadStatus : std::uint8_t {
    pending,
    probing,
    downloading,
    paused,
    completed,
    failed,
    cancelled
};

[[nodiscard]] std::string_view to_string(DownloadStatus status) noexcept;

// What the caller asks for
struct DownloadRequest {
    std::string url;
    std::string destination;   // empty: file name from the URL, in the working directory
    std::uint32_t segment_count{DEFAULT_SEGMENTS};
};

// Emitted at most once per progress interval while a job runs
struct ProgressSnapshot {
    JobId job_id{0};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};       // 0: unknown
    std::uint64_t speed_bps{0};         // average since the attempt began
    DownloadStatus status{DownloadStatus::pending};

    [[nodiscard]] double percent() const noexcept {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_downloaded) * 100.0 / static_cast<double>(total_bytes);
    }
};

// Delivered exactly once when a job reaches Completed, Failed or Cancelled
struct TerminalNotification {
    JobId job_id{0};
    DownloadStatus final_status{DownloadStatus::pending};
    std::uint32_t retry_count{0};
    std::error_code error;
    FailureKind failure{FailureKind::none};
};

// Point-in-time view of a job
struct JobSnapshot {
    JobId id{0};
    std::string url;
    std::string destination;
    DownloadStatus status{DownloadStatus::pending};
    bool finished{false};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    bool supports_range{false};
    std::uint32_t segment_count{0};
    std::uint32_t retry_count{0};
    std::uint32_t max_retries{0};
    std::error_code error;
    FailureKind failure{FailureKind::none};
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;
using FinishedCallback = std::function<void(const TerminalNotification&)>;

} // namespace splicer::core
