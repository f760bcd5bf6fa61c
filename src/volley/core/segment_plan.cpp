// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/segment_plan.hpp>
#include <algorithm>

namespace volley::core {

std::uint32_t effective_segment_count(std::uint64_t total_size,
                                      std::uint32_t requested,
                                      bool supports_ranges,
                                      std::uint32_t max_segments,
                                      std::uint64_t min_segment_size) noexcept {
    if (!supports_ranges || total_size == 0) {
        return 1;
    }

    std::uint32_t count = std::clamp<std::uint32_t>(requested, 1, std::max<std::uint32_t>(max_segments, 1));

    if (min_segment_size > 0 && total_size / count < min_segment_size) {
        // Never let a segment fall below the floor
        std::uint64_t fit = total_size / min_segment_size;
        count = static_cast<std::uint32_t>(std::max<std::uint64_t>(1, std::min<std::uint64_t>(fit, count)));
    }

    return count;
}

std::vector<SegmentRange> split_ranges(std::uint64_t total_size, std::uint32_t count) {
    std::vector<SegmentRange> plan;
    if (total_size == 0 || count == 0) {
        return plan;
    }

    // A range is never empty
    count = static_cast<std::uint32_t>(std::min<std::uint64_t>(count, total_size));

    const std::uint64_t slice = total_size / count;
    plan.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint64_t first = static_cast<std::uint64_t>(i) * slice;
        std::uint64_t last = (i == count - 1) ? total_size - 1 : first + slice - 1;
        plan.push_back(SegmentRange{i, first, last});
    }
    return plan;
}

std::vector<SegmentRange> plan_segments(std::uint64_t total_size,
                                        std::uint32_t requested,
                                        bool supports_ranges,
                                        std::uint32_t max_segments,
                                        std::uint64_t min_segment_size) {
    return split_ranges(total_size,
                        effective_segment_count(total_size, requested, supports_ranges,
                                                max_segments, min_segment_size));
}

} // namespace volley::core
