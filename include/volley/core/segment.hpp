// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/completion_queue.hpp>
#include <volley/core/config.hpp>
#include <volley/core/progress_aggregator.hpp>
#include <volley/core/segment_plan.hpp>
#include <volley/core/transfer_control.hpp>
#include <volley/core/transport.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace volley::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,     // Not started
    downloading, // Fetch in progress
    completed,   // Finished successfully
    failed       // Failed or cancelled
};

// Collaborators a worker shares with its transfer. All of them must outlive
// the worker thread.
struct SegmentContext {
    Transport& transport;
    ProgressAggregator& aggregator;
    TransferControl& control;
    CompletionQueue& completions;
    std::chrono::milliseconds report_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds pause_poll{PAUSE_POLL_INTERVAL};
};

// Range worker: fetches one byte range into its own part file on a dedicated
// thread and posts exactly one SegmentOutcome. Never retries.
class Segment {
public:
    Segment(SegmentRange range, std::string url, std::string part_path,
            SegmentContext context) noexcept;
    ~Segment();

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;
    Segment(Segment&&) = delete;
    Segment& operator=(Segment&&) = delete;

    // Spawn the worker thread
    void start();

    // Wait for the worker thread to finish (no-op if not started)
    void join() noexcept;

    // Fetch on the calling thread and post the outcome
    void run() noexcept;

    [[nodiscard]] std::uint32_t index() const noexcept { return range_.index; }
    [[nodiscard]] const SegmentRange& range() const noexcept { return range_; }
    [[nodiscard]] const std::string& part_path() const noexcept { return part_path_; }
    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }

private:
    [[nodiscard]] SegmentOutcome fetch() noexcept;
    [[nodiscard]] SegmentOutcome failure(std::error_code ec, std::string reason) const noexcept;

    SegmentRange range_;
    std::string url_;
    std::string part_path_;
    SegmentContext ctx_;
    std::atomic<SegmentState> state_{SegmentState::pending};
    std::jthread thread_;
};

} // namespace volley::core
