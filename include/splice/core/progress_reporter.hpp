// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/download_job.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace splicer::core {

// Turns byte counts into ProgressSnapshots and hands them to the callback.
// Once sealed (cancellation) nothing more is emitted.
class ProgressReporter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressReporter(JobId job_id, ProgressCallback callback = {});

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void callback(ProgressCallback callback);

    // New attempt: restart the speed clock. total_bytes 0 means unknown.
    void begin(std::uint64_t total_bytes) noexcept;

    // Build a snapshot and emit it. nullopt when sealed.
    std::optional<ProgressSnapshot> sample(std::uint64_t bytes_downloaded, DownloadStatus status) noexcept;

    // After return no emission is in progress (unless called from the callback itself)
    void seal() noexcept;

    [[nodiscard]] bool sealed() const noexcept { return sealed_.load(std::memory_order_acquire); }

    // bytes / seconds, 0 when no time has passed
    [[nodiscard]] static std::uint64_t compute_speed(std::uint64_t bytes,
                                                     std::chrono::nanoseconds elapsed) noexcept;

private:
    JobId job_id_;
    ProgressCallback callback_;
    std::mutex emit_mutex_;
    std::atomic<bool> sealed_{false};
    std::atomic<std::thread::id> emitting_{};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<Clock::rep> started_{0};
};

} // namespace splicer::core
