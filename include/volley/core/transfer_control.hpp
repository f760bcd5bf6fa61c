// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace volley::core {

// Pause/cancel token shared by a transfer's engine and all of its workers.
//
// Cancel is sticky. Pause and resume are ignored once cancelled. Workers
// block in wait_while_paused() on a condition variable instead of spinning.
class TransferControl {
public:
    TransferControl() = default;

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    // Returns true if the call changed the state
    bool pause() noexcept;
    bool resume() noexcept;
    bool cancel() noexcept;

    [[nodiscard]] bool paused() const noexcept { return paused_.load(std::memory_order_acquire); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Block while paused. Cancel is re-checked at least every `poll`.
    // Returns false if the transfer was cancelled.
    [[nodiscard]] bool wait_while_paused(std::chrono::milliseconds poll) noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
};

} // namespace volley::core
