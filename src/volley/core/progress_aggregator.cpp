// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/progress_aggregator.hpp>
#include <numeric>

namespace volley::core {

ProgressAggregator::ProgressAggregator(std::size_t segment_count)
    : bytes_(segment_count, 0)
    , rates_(segment_count, 0) {}

void ProgressAggregator::report_increment(std::uint32_t segment,
                                          std::uint64_t delta,
                                          std::uint64_t rate_bps) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (segment >= bytes_.size()) return;

    bytes_[segment] += delta;
    rates_[segment] = rate_bps;
    recompute();
}

void ProgressAggregator::report_absolute(std::uint32_t segment, std::uint64_t total_bytes) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (segment >= bytes_.size()) return;

    bytes_[segment] = total_bytes;
    rates_[segment] = 0;
    recompute();
}

ProgressSnapshot ProgressAggregator::snapshot() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::uint64_t ProgressAggregator::segment_bytes(std::uint32_t segment) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return segment < bytes_.size() ? bytes_[segment] : 0;
}

// Caller holds mutex_
void ProgressAggregator::recompute() noexcept {
    total_.bytes = std::accumulate(bytes_.begin(), bytes_.end(), std::uint64_t{0});
    total_.rate_bps = std::accumulate(rates_.begin(), rates_.end(), std::uint64_t{0});
}

} // namespace volley::core
