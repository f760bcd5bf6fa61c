// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace volley::core {

// Terminal result of one range worker
struct SegmentOutcome {
    std::uint32_t index{0};
    bool success{false};
    std::string reason;     // "Completed" or a human readable failure reason
    std::error_code error;  // Empty on success
};

// Channel through which workers report their single outcome to the engine
class CompletionQueue {
public:
    CompletionQueue() = default;

    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    void push(SegmentOutcome outcome);

    // Wait up to `timeout` for at least one outcome, then take everything queued.
    // Returns an empty vector on timeout.
    [[nodiscard]] std::vector<SegmentOutcome> drain_for(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SegmentOutcome> queue_;
};

} // namespace volley::core
