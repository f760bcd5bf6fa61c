// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/completion_queue.hpp>
#include <iterator>

namespace volley::core {

void CompletionQueue::push(SegmentOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
}

std::vector<SegmentOutcome> CompletionQueue::drain_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });

    std::vector<SegmentOutcome> drained(std::make_move_iterator(queue_.begin()),
                                        std::make_move_iterator(queue_.end()));
    queue_.clear();
    return drained;
}

} // namespace volley::core
