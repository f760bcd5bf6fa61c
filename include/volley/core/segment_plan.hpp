// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <cstdint>
#include <vector>

namespace volley::core {

// One contiguous byte range of the source, both ends inclusive
struct SegmentRange {
    std::uint32_t index{0};
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return last - first + 1; }

    bool operator==(const SegmentRange&) const = default;
};

// Number of segments actually used for a transfer.
//
// The request is clamped to [1, max_segments]. Without range support the
// answer is always 1. If an equal split would give segments smaller than
// min_segment_size the count drops to max(1, total_size / min_segment_size).
[[nodiscard]] std::uint32_t effective_segment_count(std::uint64_t total_size,
                                                    std::uint32_t requested,
                                                    bool supports_ranges,
                                                    std::uint32_t max_segments = MAX_SEGMENTS,
                                                    std::uint64_t min_segment_size = MIN_SEGMENT_SIZE) noexcept;

// Split [0, total_size) into `count` ranges. Ranges 0..count-2 get
// total_size / count bytes, the last one absorbs the remainder.
// Returns an empty plan when total_size or count is zero.
[[nodiscard]] std::vector<SegmentRange> split_ranges(std::uint64_t total_size, std::uint32_t count);

// effective_segment_count() followed by split_ranges()
[[nodiscard]] std::vector<SegmentRange> plan_segments(std::uint64_t total_size,
                                                      std::uint32_t requested,
                                                      bool supports_ranges,
                                                      std::uint32_t max_segments = MAX_SEGMENTS,
                                                      std::uint64_t min_segment_size = MIN_SEGMENT_SIZE);

} // namespace volley::core
