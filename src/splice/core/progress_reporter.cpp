// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/progress_reporter.hpp>
#include <splice/core/log.hpp>

namespace splicer::core {

ProgressReporter::ProgressReporter(JobId job_id, ProgressCallback callback)
    : job_id_(job_id)
    , callback_(std::move(callback)) {
    begin(0);
}

void ProgressReporter::callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    callback_ = std::move(callback);
}

void ProgressReporter::begin(std::uint64_t total_bytes) noexcept {
    total_bytes_.store(total_bytes, std::memory_order_relaxed);
    started_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

std::uint64_t ProgressReporter::compute_speed(std::uint64_t bytes, std::chrono::nanoseconds elapsed) noexcept {
    if (elapsed.count() <= 0) return 0;
    const double seconds = std::chrono::duration<double>(elapsed).count();
    return static_cast<std::uint64_t>(static_cast<double>(bytes) / seconds);
}

std::optional<ProgressSnapshot>
ProgressReporter::sample(std::uint64_t bytes_downloaded, DownloadStatus status) noexcept {
    if (sealed()) return std::nullopt;

    const auto started = Clock::time_point(Clock::duration(started_.load(std::memory_order_relaxed)));
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started);

    ProgressSnapshot snapshot;
    snapshot.job_id = job_id_;
    snapshot.bytes_downloaded = bytes_downloaded;
    snapshot.total_bytes = total_bytes_.load(std::memory_order_relaxed);
    snapshot.speed_bps = compute_speed(bytes_downloaded, elapsed);
    snapshot.status = status;

    std::lock_guard<std::mutex> lock(emit_mutex_);
    // Re-check under the lock: seal() may have won the race
    if (sealed()) return std::nullopt;
    if (callback_) {
        emitting_.store(std::this_thread::get_id(), std::memory_order_release);
        try {
            callback_(snapshot);
        } catch (const std::exception& e) {
            log()->warn("progress callback for job {} threw: {}", job_id_, e.what());
        }
        emitting_.store(std::thread::id{}, std::memory_order_release);
    }
    return snapshot;
}

void ProgressReporter::seal() noexcept {
    sealed_.store(true, std::memory_order_release);
    // Called from inside the callback: the lock is ours already
    if (emitting_.load(std::memory_order_acquire) == std::this_thread::get_id()) return;
    std::lock_guard<std::mutex> lock(emit_mutex_);
}

} // namespace splicer::core
