// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/transfer_control.hpp>

namespace volley::core {

bool TransferControl::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_relaxed) || paused_.load(std::memory_order_relaxed)) {
        return false;
    }
    paused_.store(true, std::memory_order_release);
    return true;
}

bool TransferControl::resume() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed) || !paused_.load(std::memory_order_relaxed)) {
            return false;
        }
        paused_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    return true;
}

bool TransferControl::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return false;
        }
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    return true;
}

bool TransferControl::wait_while_paused(std::chrono::milliseconds poll) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    while (paused_.load(std::memory_order_relaxed) && !cancelled_.load(std::memory_order_relaxed)) {
        cv_.wait_for(lock, poll);
    }
    return !cancelled_.load(std::memory_order_relaxed);
}

} // namespace volley::core
