// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/transfer_control.hpp>

namespace splicer::core {

void TransferControl::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_.store(true, std::memory_order_release);
}

void TransferControl::resume() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
}

void TransferControl::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

void TransferControl::rearm() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
}

bool TransferControl::wait_while_paused() noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !paused() || cancelled(); });
    return !cancelled();
}

bool TransferControl::wait_for_cancel(std::chrono::milliseconds timeout) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled(); });
}

} // namespace splicer::core
