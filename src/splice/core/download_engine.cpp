// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/download_engine.hpp>
#include <splice/core/log.hpp>
#include <splice/core/segment_planner.hpp>
#include <splice/disk/error.hpp>
#include <splice/disk/file.hpp>
#include <splice/disk/reassembler.hpp>
#include <numeric>
#include <system_error>

namespace splicer::core {

std::string_view to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::pending:     return "pending";
        case DownloadStatus::probing:     return "probing";
        case DownloadStatus::downloading: return "downloading";
        case DownloadStatus::paused:      return "paused";
        case DownloadStatus::completed:   return "completed";
        case DownloadStatus::failed:      return "failed";
        case DownloadStatus::cancelled:   return "cancelled";
    }
    return "unknown";
}

namespace {

FailureKind failure_kind_of(const std::error_code& ec) noexcept {
    return ec.category() == disk::disk_errc_category() ? FailureKind::io : FailureKind::fetch;
}

} // namespace

//=============================================================================
// DownloadEngine
//=============================================================================

std::expected<std::unique_ptr<DownloadEngine>, std::error_code>
DownloadEngine::create(JobId id, DownloadRequest request, std::shared_ptr<Transport> transport,
                       DownloadConfig config) {
    auto url = Url::parse(request.url);
    if (!url) {
        return std::unexpected(url.error());
    }
    if (!url->is_supported()) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_scheme));
    }
    if (request.segment_count < MIN_SEGMENTS || request.segment_count > MAX_SEGMENTS) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_count));
    }
    if (!transport || config.progress_interval.count() <= 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }

    std::filesystem::path destination = request.destination.empty()
        ? std::filesystem::path(url->filename())
        : std::filesystem::path(request.destination);

    std::error_code fs_ec;
    if (std::filesystem::is_directory(destination, fs_ec)) {
        destination /= url->filename();
    }

    return std::unique_ptr<DownloadEngine>(new DownloadEngine(
        id, std::move(request), std::move(*url), std::move(destination), std::move(transport),
        std::move(config)));
}

DownloadEngine::DownloadEngine(JobId id, DownloadRequest request, Url url,
                               std::filesystem::path destination,
                               std::shared_ptr<Transport> transport, DownloadConfig config)
    : id_(id)
    , request_(std::move(request))
    , url_(std::move(url))
    , destination_(std::move(destination))
    , transport_(std::move(transport))
    , config_(std::move(config))
    , reporter_(id) {}

DownloadEngine::~DownloadEngine() {
    // Nobody is listening any more
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        finished_callback_ = nullptr;
    }
    reporter_.callback(nullptr);

    (void)cancel();
    if (supervisor_.joinable()) {
        // Destroyed from its own finished callback: the thread is about to return
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            supervisor_.detach();
        } else {
            supervisor_.join();
        }
    }
}

void DownloadEngine::on_progress(ProgressCallback cb) {
    reporter_.callback(std::move(cb));
}

void DownloadEngine::on_finished(FinishedCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    finished_callback_ = std::move(cb);
}

//=============================================================================
// Commands
//=============================================================================

std::error_code DownloadEngine::start() noexcept {
    std::jthread previous;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            log()->warn("job {}: cannot restart from its own worker thread", id_);
            return make_error_code(DownloadErrc::invalid_transition);
        }
        // A failed lifetime is over only once its notification was delivered
        if (status_ == DownloadStatus::failed && final_) {
            done_cv_.wait(lock, [this] { return notified_; });
        }
        const bool restart = status_ == DownloadStatus::failed && final_;
        if (status_ != DownloadStatus::pending && !restart) {
            log()->debug("job {}: start ignored in state {}", id_, to_string(status_));
            return make_error_code(DownloadErrc::invalid_transition);
        }
        if (restart) {
            retry_count_ = 0;
            error_.clear();
            failure_ = FailureKind::none;
            final_ = false;
            notified_ = false;
        }
        status_ = DownloadStatus::probing;
        artifacts_ = Artifacts::none;
        previous = std::move(supervisor_);
    }

    // The previous supervisor already delivered its terminal notification
    if (previous.joinable()) {
        previous.join();
    }

    control_.rearm();
    log()->info("job {}: starting {} -> {}", id_, url_.redacted(), destination_.string());

    try {
        std::jthread worker([this](std::stop_token stoken) { run(stoken); });
        std::lock_guard<std::mutex> lock(mutex_);
        supervisor_ = std::move(worker);
    } catch (const std::system_error& e) {
        log()->error("job {}: cannot start worker thread: {}", id_, e.what());
        finish(DownloadStatus::failed, e.code(), FailureKind::none);
        return e.code();
    }
    return {};
}

std::error_code DownloadEngine::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != DownloadStatus::downloading) {
        log()->debug("job {}: pause ignored in state {}", id_, to_string(status_));
        return make_error_code(DownloadErrc::invalid_transition);
    }
    status_ = DownloadStatus::paused;
    control_.pause();
    log()->info("job {}: paused", id_);
    return {};
}

std::error_code DownloadEngine::resume() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != DownloadStatus::paused) {
        log()->debug("job {}: resume ignored in state {}", id_, to_string(status_));
        return make_error_code(DownloadErrc::invalid_transition);
    }
    status_ = DownloadStatus::downloading;
    control_.resume();
    log()->info("job {}: resumed", id_);
    return {};
}

std::error_code DownloadEngine::cancel() noexcept {
    bool was_pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (final_ || cancel_requested_) {
            log()->debug("job {}: cancel ignored in state {}", id_, to_string(status_));
            return make_error_code(DownloadErrc::invalid_transition);
        }
        was_pending = status_ == DownloadStatus::pending;
        cancel_requested_ = true;
        status_ = DownloadStatus::cancelled;
        control_.cancel();
    }

    // No progress may follow the cancel
    reporter_.seal();
    log()->info("job {}: cancelled", id_);

    if (was_pending) {
        finish(DownloadStatus::cancelled, {}, FailureKind::none);
    }
    return {};
}

//=============================================================================
// Queries
//=============================================================================

DownloadStatus DownloadEngine::status() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool DownloadEngine::finished() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_;
}

std::uint32_t DownloadEngine::retry_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

JobSnapshot DownloadEngine::snapshot() const {
    JobSnapshot snap;
    snap.id = id_;
    snap.url = url_.redacted();
    snap.destination = destination_.string();
    snap.max_retries = config_.max_retries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.status = status_;
        snap.finished = final_;
        snap.total_bytes = total_size_.value_or(0);
        snap.supports_range = supports_range_;
        snap.retry_count = retry_count_;
        snap.error = error_;
        snap.failure = failure_;
    }
    {
        std::lock_guard<std::mutex> lock(segments_mutex_);
        snap.segment_count = static_cast<std::uint32_t>(segments_.size());
    }
    snap.bytes_downloaded = downloaded_bytes();
    return snap;
}

std::vector<SegmentProgress> DownloadEngine::segment_progress() const {
    std::lock_guard<std::mutex> lock(segments_mutex_);
    std::vector<SegmentProgress> result;
    result.reserve(segments_.size());
    for (const auto& seg : segments_) {
        result.push_back(seg->progress());
    }
    return result;
}

std::uint64_t DownloadEngine::downloaded_bytes() const noexcept {
    std::lock_guard<std::mutex> lock(segments_mutex_);
    return std::accumulate(segments_.begin(), segments_.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const auto& seg) { return sum + seg->downloaded(); });
}

void DownloadEngine::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return notified_; });
}

bool DownloadEngine::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return notified_; });
}

//=============================================================================
// Supervisor
//=============================================================================

bool DownloadEngine::transition(DownloadStatus from, DownloadStatus to) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != from) return false;
    status_ = to;
    return true;
}

void DownloadEngine::report_progress() noexcept {
    reporter_.sample(downloaded_bytes(), status());
}

void DownloadEngine::run(std::stop_token stoken) noexcept {
    // A shared owner may drop the job from inside the finished callback
    const auto keep_alive = weak_from_this().lock();

    for (;;) {
        const AttemptResult attempt = run_attempt();

        if (control_.cancelled() || stoken.stop_requested()) {
            finish(DownloadStatus::cancelled, {}, FailureKind::none);
            return;
        }
        if (attempt.ok()) {
            finish(DownloadStatus::completed, {}, FailureKind::none);
            return;
        }

        bool retry = false;
        std::uint32_t attempt_number = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancel_requested_) {
                status_ = DownloadStatus::failed;
                error_ = attempt.error;
                failure_ = attempt.failure;
                retry = is_retryable(attempt.error) && retry_count_ < config_.max_retries;
                attempt_number = retry_count_ + 1;
            }
        }
        if (!retry) {
            finish(DownloadStatus::failed, attempt.error, attempt.failure);
            return;
        }

        log()->warn("job {}: attempt {} failed ({} error: {}), retrying in {} ms",
                    id_, attempt_number, to_string(attempt.failure), attempt.error.message(),
                    config_.retry_backoff.count());

        if (control_.wait_for_cancel(config_.retry_backoff) || stoken.stop_requested()) {
            finish(DownloadStatus::cancelled, {}, FailureKind::none);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancel_requested_) continue;
            ++retry_count_;
            status_ = DownloadStatus::probing;
        }
        control_.rearm();
    }
}

DownloadEngine::AttemptResult DownloadEngine::run_attempt() noexcept {
    const AttemptResult cancelled{make_error_code(DownloadErrc::cancelled), FailureKind::none};

    {
        std::lock_guard<std::mutex> lock(segments_mutex_);
        segments_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_size_.reset();
        supports_range_ = false;
    }
    if (control_.cancelled()) return cancelled;

    const AbortCheck abort = [this] { return control_.cancelled(); };
    auto probe = transport_->probe(url_, abort);
    if (control_.cancelled()) return cancelled;
    if (!probe) {
        log()->warn("job {}: probe of {} failed: {}", id_, url_.redacted(), probe.error().message());
        return {probe.error(), FailureKind::probe};
    }

    const auto plan = plan_segments(probe->total_size, probe->supports_range,
                                    request_.segment_count, config_.single_segment_threshold);
    {
        std::lock_guard<std::mutex> lock(segments_mutex_);
        for (const auto& span : plan) {
            segments_.push_back(std::make_unique<Segment>(span));
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_size_ = probe->total_size;
        supports_range_ = probe->supports_range;
    }

    if (!transition(DownloadStatus::probing, DownloadStatus::downloading)) {
        return cancelled;
    }

    log()->info("job {}: size {}, ranges {}, {} segment(s)", id_,
                probe->total_size ? std::to_string(*probe->total_size) : "unknown",
                probe->supports_range ? "yes" : "no", plan.size());

    reporter_.begin(probe->total_size.value_or(0));
    report_progress();

    return is_single_stream(plan) ? download_single() : download_segments();
}

DownloadEngine::AttemptResult DownloadEngine::download_single() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_ = Artifacts::destination;
    }

    auto sink = disk::File::create(destination_.string());
    if (!sink) {
        log()->error("job {}: cannot create {}: {}", id_, destination_.string(), sink.error().message());
        return {sink.error(), FailureKind::io};
    }

    // Only the supervisor replaces segments_, so the reference is stable
    Segment& segment = *segments_.front();

    SegmentFetcher fetcher(*transport_, control_);
    fetcher.chunk_observer([this](std::uint64_t) { report_progress(); });

    const SegmentResult result = fetcher.fetch(segment, url_, *sink);
    sink->close();

    switch (result.outcome) {
        case SegmentOutcome::complete:
            return {};
        case SegmentOutcome::cancelled:
            return {make_error_code(DownloadErrc::cancelled), FailureKind::none};
        case SegmentOutcome::failed:
            break;
    }
    return {result.error, failure_kind_of(result.error)};
}

DownloadEngine::AttemptResult DownloadEngine::download_segments() noexcept {
    const auto scratch = disk::scratch_dir_for(destination_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_ = Artifacts::scratch;
    }
    if (auto ec = disk::prepare_scratch_dir(scratch)) {
        return {ec, FailureKind::io};
    }

    const std::size_t count = segments_.size();

    // Fresh (truncated) sinks: a retried attempt never reuses partial bytes
    std::vector<disk::File> sinks;
    sinks.reserve(count);
    for (const auto& seg : segments_) {
        auto file = disk::File::create(disk::sink_path(scratch, seg->index()).string());
        if (!file) {
            log()->error("job {}: cannot create sink for segment {}: {}", id_, seg->index(),
                         file.error().message());
            return {file.error(), FailureKind::io};
        }
        sinks.push_back(std::move(*file));
    }

    std::vector<SegmentResult> results(count);
    std::size_t done = 0;
    std::mutex done_mutex;
    std::condition_variable done_cv;

    {
        std::vector<std::jthread> workers;
        workers.reserve(count);

        for (std::size_t i = 0; i < count; ++i) {
            try {
                workers.emplace_back([&, i] {
                    SegmentFetcher fetcher(*transport_, control_);
                    const SegmentResult r = fetcher.fetch(*segments_[i], url_, sinks[i]);
                    sinks[i].close();

                    std::lock_guard<std::mutex> lk(done_mutex);
                    results[i] = r;
                    ++done;
                    done_cv.notify_one();
                });
            } catch (const std::system_error& e) {
                log()->error("job {}: cannot start fetcher for segment {}: {}", id_, i, e.what());
                std::lock_guard<std::mutex> lk(done_mutex);
                results[i] = SegmentResult{segments_[i]->index(), SegmentOutcome::failed, e.code()};
                ++done;
            }
        }

        // Sample progress on a fixed cadence until every fetcher reported
        std::unique_lock<std::mutex> lk(done_mutex);
        while (done < count) {
            if (!done_cv.wait_for(lk, config_.progress_interval, [&] { return done == count; })) {
                lk.unlock();
                report_progress();
                lk.lock();
            }
        }
    }

    if (control_.cancelled()) {
        return {make_error_code(DownloadErrc::cancelled), FailureKind::none};
    }

    for (const auto& r : results) {
        if (r.outcome == SegmentOutcome::failed) {
            return {r.error, failure_kind_of(r.error)};
        }
    }

    report_progress();

    std::vector<disk::MergePart> parts;
    parts.reserve(count);
    for (const auto& seg : segments_) {
        parts.push_back({seg->index(), disk::sink_path(scratch, seg->index()), seg->length()});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_ = Artifacts::merging;
    }
    if (auto ec = disk::merge(std::move(parts), destination_)) {
        log()->error("job {}: reassembly of {} failed: {}", id_, destination_.string(), ec.message());
        return {ec, FailureKind::io};
    }
    return {};
}

void DownloadEngine::cleanup_artifacts() noexcept {
    Artifacts artifacts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts = artifacts_;
        artifacts_ = Artifacts::none;
    }

    std::error_code ec;
    if (artifacts == Artifacts::scratch || artifacts == Artifacts::merging) {
        if (auto rm = disk::remove_scratch_dir(disk::scratch_dir_for(destination_))) {
            log()->warn("job {}: cannot remove scratch directory: {}", id_, rm.message());
        }
    }
    if (artifacts == Artifacts::destination || artifacts == Artifacts::merging) {
        std::filesystem::remove(destination_, ec);
        if (ec) {
            log()->warn("job {}: cannot remove partial {}: {}", id_, destination_.string(), ec.message());
        }
    }
}

void DownloadEngine::finish(DownloadStatus status, std::error_code ec, FailureKind failure) noexcept {
    TerminalNotification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (final_) return;
        if (cancel_requested_) {
            status = DownloadStatus::cancelled;
        }
        if (status == DownloadStatus::cancelled) {
            ec = make_error_code(DownloadErrc::cancelled);
            failure = FailureKind::none;
        }
        status_ = status;
        final_ = true;
        error_ = ec;
        failure_ = failure;
        note = TerminalNotification{id_, status, retry_count_, ec, failure};
    }

    if (status == DownloadStatus::cancelled) {
        cleanup_artifacts();
    } else {
        report_progress();
    }

    switch (status) {
        case DownloadStatus::completed:
            log()->info("job {}: completed {} ({} retries)", id_, destination_.string(), note.retry_count);
            break;
        case DownloadStatus::failed:
            log()->error("job {}: failed after {} retries ({} error: {})", id_, note.retry_count,
                         to_string(failure), ec.message());
            break;
        default:
            log()->info("job {}: finished as {}", id_, to_string(status));
            break;
    }

    FinishedCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = finished_callback_;
    }
    if (cb) {
        try {
            cb(note);
        } catch (const std::exception& e) {
            log()->warn("job {}: finished callback threw: {}", id_, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        notified_ = true;
    }
    done_cv_.notify_all();
}

} // namespace splicer::core
