// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>

namespace volley::core {

constexpr std::uint64_t MIN_SEGMENT_SIZE = 1024 * 1024;             // 1 MiB floor per segment
constexpr std::uint32_t DEFAULT_SEGMENTS = 8;
constexpr std::uint32_t MAX_SEGMENTS = 16;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t PROBE_TIMEOUT_SEC = 30;

// Progress is reported (worker -> aggregator) and emitted (engine -> caller)
// at this cadence
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};
constexpr std::chrono::milliseconds PAUSE_POLL_INTERVAL{100};

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;                 // 64 KiB read increment
constexpr std::size_t MERGE_BUFFER_SIZE = 1024 * 1024;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

} // namespace volley::core
