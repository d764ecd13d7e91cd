// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/config.hpp>
#include <splice/core/download_job.hpp>
#include <splice/core/error.hpp>
#include <splice/core/progress_reporter.hpp>
#include <splice/core/segment.hpp>
#include <splice/core/segment_fetcher.hpp>
#include <splice/core/transfer_control.hpp>
#include <splice/core/transport.hpp>
#include <splice/core/url.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace splicer::core {

// Drives one download job: probe, plan, parallel segment fetch, merge,
// with pause/resume/cancel and automatic retry of failed attempts.
class DownloadEngine : public std::enable_shared_from_this<DownloadEngine> {
public:
    // Validates the request; the destination defaults to the URL's file name
    [[nodiscard]] static std::expected<std::unique_ptr<DownloadEngine>, std::error_code>
    create(JobId id, DownloadRequest request, std::shared_ptr<Transport> transport,
           DownloadConfig config = {});

    ~DownloadEngine();

    // Non-copyable, non-movable (worker threads hold this)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) noexcept = delete;
    DownloadEngine& operator=(DownloadEngine&&) noexcept = delete;

    // Commands. Outside their valid states they change nothing and
    // return DownloadErrc::invalid_transition.
    // start: Pending, or Failed after retries ran out (resets the retry count)
    std::error_code start() noexcept;
    // pause: Downloading only
    std::error_code pause() noexcept;
    // resume: Paused only
    std::error_code resume() noexcept;
    // cancel: any state that is not final
    std::error_code cancel() noexcept;

    // Set callbacks (thread-safe); invoked from worker threads
    void on_progress(ProgressCallback cb);
    void on_finished(FinishedCallback cb);

    [[nodiscard]] JobId id() const noexcept { return id_; }
    [[nodiscard]] const Url& url() const noexcept { return url_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

    [[nodiscard]] DownloadStatus status() const noexcept;
    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] std::uint32_t retry_count() const noexcept;
    [[nodiscard]] JobSnapshot snapshot() const;
    [[nodiscard]] std::vector<SegmentProgress> segment_progress() const;

    // Block until the terminal notification has been delivered
    void wait() const;
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

private:
    DownloadEngine(JobId id, DownloadRequest request, Url url, std::filesystem::path destination,
                   std::shared_ptr<Transport> transport, DownloadConfig config);

    struct AttemptResult {
        std::error_code error;
        FailureKind failure{FailureKind::none};

        [[nodiscard]] bool ok() const noexcept { return !error; }
    };

    enum class Artifacts : std::uint8_t {
        none,
        scratch,      // segment sinks under the scratch directory
        destination,  // partial destination written directly
        merging       // sinks plus the destination being assembled
    };

    // Supervisor thread: attempt loop with retries
    void run(std::stop_token stoken) noexcept;

    [[nodiscard]] AttemptResult run_attempt() noexcept;
    [[nodiscard]] AttemptResult download_single() noexcept;
    [[nodiscard]] AttemptResult download_segments() noexcept;

    [[nodiscard]] bool transition(DownloadStatus from, DownloadStatus to) noexcept;
    void finish(DownloadStatus status, std::error_code ec, FailureKind failure) noexcept;
    void cleanup_artifacts() noexcept;

    [[nodiscard]] std::uint64_t downloaded_bytes() const noexcept;
    void report_progress() noexcept;

    JobId id_;
    DownloadRequest request_;
    Url url_;
    std::filesystem::path destination_;
    std::shared_ptr<Transport> transport_;
    DownloadConfig config_;

    TransferControl control_;
    ProgressReporter reporter_;

    // Job state, guarded by mutex_
    mutable std::mutex mutex_;
    mutable std::condition_variable done_cv_;
    DownloadStatus status_{DownloadStatus::pending};
    bool final_{false};          // final status decided
    bool notified_{false};       // terminal notification delivered
    bool cancel_requested_{false};
    std::uint32_t retry_count_{0};
    std::optional<std::uint64_t> total_size_;
    bool supports_range_{false};
    std::error_code error_;
    FailureKind failure_{FailureKind::none};
    Artifacts artifacts_{Artifacts::none};

    // Segments of the current attempt
    mutable std::mutex segments_mutex_;
    std::vector<std::unique_ptr<Segment>> segments_;

    FinishedCallback finished_callback_;
    std::mutex callback_mutex_;  // Protects finished_callback_

    std::jthread supervisor_;
};

// Aggregate counts over every job
struct ManagerStats {
    std::size_t total{0};
    std::size_t downloading{0};
    std::size_t paused{0};
    std::size_t completed{0};
    std::size_t failed{0};
};

// Owns the jobs and routes commands to them by id
class DownloadManager {
public:
    // Process-wide manager using libcurl
    static DownloadManager& instance();

    explicit DownloadManager(std::shared_ptr<Transport> transport, DownloadConfig config = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Defaults for jobs created afterwards
    void config(const DownloadConfig& cfg);
    [[nodiscard]] DownloadConfig config() const;

    // Forwarded from every job (thread-safe)
    void on_progress(ProgressCallback cb);
    void on_finished(FinishedCallback cb);

    // Create a new download (Pending); request.segment_count 0 uses the configured default
    [[nodiscard]] std::expected<JobId, std::error_code> create_download(DownloadRequest request);

    std::error_code start(JobId id);
    std::error_code pause(JobId id);
    std::error_code resume(JobId id);
    std::error_code cancel(JobId id);

    // Remove a download (must be completed/failed/cancelled)
    std::error_code remove(JobId id);

    // Start every Pending job; returns how many were started
    std::size_t start_all();
    // Pause every Downloading job; returns how many were paused
    std::size_t pause_all();
    // Drop Completed and Cancelled jobs; returns how many were removed
    std::size_t clear_finished();

    [[nodiscard]] ManagerStats stats() const;
    [[nodiscard]] std::expected<JobSnapshot, std::error_code> snapshot(JobId id) const;
    [[nodiscard]] std::expected<std::vector<SegmentProgress>, std::error_code> segment_progress(JobId id) const;
    [[nodiscard]] std::vector<JobId> downloads() const;

    std::error_code wait(JobId id) const;
    // Ok(true) once the job's terminal notification was delivered
    [[nodiscard]] std::expected<bool, std::error_code>
    wait_for(JobId id, std::chrono::milliseconds timeout) const;

private:
    [[nodiscard]] std::shared_ptr<DownloadEngine> find(JobId id) const;

    void dispatch_progress(const ProgressSnapshot& snapshot);
    void dispatch_finished(const TerminalNotification& note);

    std::shared_ptr<Transport> transport_;
    DownloadConfig config_;

    std::map<JobId, std::shared_ptr<DownloadEngine>> downloads_;
    JobId next_id_{1};
    mutable std::mutex mutex_;

    ProgressCallback progress_callback_;
    FinishedCallback finished_callback_;
    std::mutex callback_mutex_;
};

} // namespace splicer::core
