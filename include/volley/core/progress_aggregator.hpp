// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

namespace volley::core {

// Consistent view of all segments at one instant
struct ProgressSnapshot {
    std::uint64_t bytes{0};      // Sum of bytes transferred across segments
    std::uint64_t rate_bps{0};   // Sum of last instantaneous rates
};

// Combines per-segment progress into one total. Every mutation and every
// snapshot happens under a single mutex, so a reader never sees a sum that
// mixes old and new values of different segments.
//
// One aggregator is owned per transfer and handed to its workers by reference.
class ProgressAggregator {
public:
    explicit ProgressAggregator(std::size_t segment_count);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Add `delta` bytes to a segment and record its instantaneous rate
    void report_increment(std::uint32_t segment, std::uint64_t delta, std::uint64_t rate_bps) noexcept;

    // Overwrite a segment's byte count with its exact final size. The
    // segment is finished, so its rate drops to zero.
    void report_absolute(std::uint32_t segment, std::uint64_t total_bytes) noexcept;

    [[nodiscard]] ProgressSnapshot snapshot() const noexcept;

    // Bytes reported for one segment (0 for an unknown index)
    [[nodiscard]] std::uint64_t segment_bytes(std::uint32_t segment) const noexcept;

    [[nodiscard]] std::size_t segment_count() const noexcept { return bytes_.size(); }

private:
    void recompute() noexcept;

    mutable std::mutex mutex_;
    std::vector<std::uint64_t> bytes_;
    std::vector<std::uint64_t> rates_;
    ProgressSnapshot total_;
};

} // namespace volley::core
