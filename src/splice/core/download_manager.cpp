// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/download_engine.hpp>
#include <splice/core/curl_transport.hpp>
#include <splice/core/log.hpp>

namespace splicer::core {

//=============================================================================
// DownloadManager
//=============================================================================

DownloadManager& DownloadManager::instance() {
    static DownloadManager mgr(std::make_shared<CurlTransport>());
    return mgr;
}

DownloadManager::DownloadManager(std::shared_ptr<Transport> transport, DownloadConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config)) {}

DownloadManager::~DownloadManager() {
    std::map<JobId, std::shared_ptr<DownloadEngine>> jobs;
    {
        auto lock = std::unique_lock(mutex_);
        jobs.swap(downloads_);
    }
    // Running jobs keep themselves alive; stop them while we still exist
    for (auto& [id, engine] : jobs) {
        (void)engine->cancel();
        engine->wait();
    }
    jobs.clear();
}

void DownloadManager::config(const DownloadConfig& cfg) {
    auto lock = std::unique_lock(mutex_);
    config_ = cfg;
}

DownloadConfig DownloadManager::config() const {
    auto lock = std::unique_lock(mutex_);
    return config_;
}

void DownloadManager::on_progress(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = std::move(cb);
}

void DownloadManager::on_finished(FinishedCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    finished_callback_ = std::move(cb);
}

void DownloadManager::dispatch_progress(const ProgressSnapshot& snapshot) {
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = progress_callback_;
    }
    if (cb) cb(snapshot);
}

void DownloadManager::dispatch_finished(const TerminalNotification& note) {
    FinishedCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = finished_callback_;
    }
    if (cb) cb(note);
}

std::expected<JobId, std::error_code> DownloadManager::create_download(DownloadRequest request) {
    auto lock = std::unique_lock(mutex_);

    if (request.segment_count == 0) {
        request.segment_count = config_.segments;
    }

    const JobId id = next_id_;
    auto engine = DownloadEngine::create(id, std::move(request), transport_, config_);
    if (!engine) {
        log()->warn("rejected download request: {}", engine.error().message());
        return std::unexpected(engine.error());
    }
    ++next_id_;

    (*engine)->on_progress([this](const ProgressSnapshot& s) { dispatch_progress(s); });
    (*engine)->on_finished([this](const TerminalNotification& n) { dispatch_finished(n); });

    log()->debug("job {} created for {}", id, (*engine)->url().redacted());
    downloads_[id] = std::shared_ptr<DownloadEngine>(std::move(*engine));
    return id;
}

std::shared_ptr<DownloadEngine> DownloadManager::find(JobId id) const {
    auto lock = std::unique_lock(mutex_);
    auto it = downloads_.find(id);
    return it == downloads_.end() ? nullptr : it->second;
}

// Commands run outside mutex_: engine callbacks may call back into the manager

std::error_code DownloadManager::start(JobId id) {
    auto engine = find(id);
    if (!engine) return make_error_code(DownloadErrc::unknown_job);
    return engine->start();
}

std::error_code DownloadManager::pause(JobId id) {
    auto engine = find(id);
    if (!engine) return make_error_code(DownloadErrc::unknown_job);
    return engine->pause();
}

std::error_code DownloadManager::resume(JobId id) {
    auto engine = find(id);
    if (!engine) return make_error_code(DownloadErrc::unknown_job);
    return engine->resume();
}

std::error_code DownloadManager::cancel(JobId id) {
    auto engine = find(id);
    if (!engine) return make_error_code(DownloadErrc::unknown_job);
    return engine->cancel();
}

std::error_code DownloadManager::remove(JobId id) {
    std::shared_ptr<DownloadEngine> removed;
    {
        auto lock = std::unique_lock(mutex_);
        auto it = downloads_.find(id);
        if (it == downloads_.end()) {
            return make_error_code(DownloadErrc::unknown_job);
        }
        if (!it->second->finished()) {
            return make_error_code(DownloadErrc::invalid_transition);
        }
        removed = std::move(it->second);
        downloads_.erase(it);
    }
    return {};
}

std::size_t DownloadManager::start_all() {
    std::vector<std::shared_ptr<DownloadEngine>> pending;
    {
        auto lock = std::unique_lock(mutex_);
        for (const auto& [id, engine] : downloads_) {
            if (engine->status() == DownloadStatus::pending) pending.push_back(engine);
        }
    }
    std::size_t started = 0;
    for (const auto& engine : pending) {
        if (!engine->start()) ++started;
    }
    return started;
}

std::size_t DownloadManager::pause_all() {
    std::vector<std::shared_ptr<DownloadEngine>> active;
    {
        auto lock = std::unique_lock(mutex_);
        for (const auto& [id, engine] : downloads_) {
            if (engine->status() == DownloadStatus::downloading) active.push_back(engine);
        }
    }
    std::size_t paused = 0;
    for (const auto& engine : active) {
        if (!engine->pause()) ++paused;
    }
    return paused;
}

std::size_t DownloadManager::clear_finished() {
    std::vector<std::shared_ptr<DownloadEngine>> removed;
    {
        auto lock = std::unique_lock(mutex_);
        for (auto it = downloads_.begin(); it != downloads_.end();) {
            const auto status = it->second->status();
            if (it->second->finished() &&
                (status == DownloadStatus::completed || status == DownloadStatus::cancelled)) {
                removed.push_back(std::move(it->second));
                it = downloads_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return removed.size();
}

ManagerStats DownloadManager::stats() const {
    auto lock = std::unique_lock(mutex_);
    ManagerStats s;
    s.total = downloads_.size();
    for (const auto& [id, engine] : downloads_) {
        switch (engine->status()) {
            case DownloadStatus::downloading: ++s.downloading; break;
            case DownloadStatus::paused:      ++s.paused; break;
            case DownloadStatus::completed:   ++s.completed; break;
            case DownloadStatus::failed:      ++s.failed; break;
            default: break;
        }
    }
    return s;
}

std::expected<JobSnapshot, std::error_code> DownloadManager::snapshot(JobId id) const {
    auto engine = find(id);
    if (!engine) return std::unexpected(make_error_code(DownloadErrc::unknown_job));
    return engine->snapshot();
}

std::expected<std::vector<SegmentProgress>, std::error_code>
DownloadManager::segment_progress(JobId id) const {
    auto engine = find(id);
    if (!engine) return std::unexpected(make_error_code(DownloadErrc::unknown_job));
    return engine->segment_progress();
}

std::vector<JobId> DownloadManager::downloads() const {
    auto lock = std::unique_lock(mutex_);
    std::vector<JobId> result;
    result.reserve(downloads_.size());
    for (const auto& [id, engine] : downloads_) {
        result.push_back(id);
    }
    return result;
}

std::error_code DownloadManager::wait(JobId id) const {
    auto engine = find(id);
    if (!engine) return make_error_code(DownloadErrc::unknown_job);
    engine->wait();
    return {};
}

std::expected<bool, std::error_code>
DownloadManager::wait_for(JobId id, std::chrono::milliseconds timeout) const {
    auto engine = find(id);
    if (!engine) return std::unexpected(make_error_code(DownloadErrc::unknown_job));
    return engine->wait_for(timeout);
}

} // namespace splicer::core
