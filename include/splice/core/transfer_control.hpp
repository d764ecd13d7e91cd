// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace splicer::core {

// Pause and cancel flags for one download.
// The coordinator writes them; every fetcher of the job reads them.
class TransferControl {
public:
    TransferControl() = default;

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    void pause() noexcept;
    void resume() noexcept;
    void cancel() noexcept;

    // Clears the pause flag for a new attempt; cancellation is permanent
    void rearm() noexcept;

    [[nodiscard]] bool paused() const noexcept { return paused_.load(std::memory_order_acquire); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Block while paused. Returns false if cancelled before or during the wait.
    [[nodiscard]] bool wait_while_paused() noexcept;

    // Sleep up to timeout; returns true if cancelled meanwhile
    [[nodiscard]] bool wait_for_cancel(std::chrono::milliseconds timeout) noexcept;

private:
    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace splicer::core
