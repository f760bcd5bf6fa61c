// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/transport.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace volley::core {

struct ProbeResult {
    std::uint64_t total_size{0};
    bool supports_ranges{false};
    std::string content_type;
    std::string filename;  // Content-Disposition name, if any
};

// Learn the size of the resource and whether it may be fetched in ranges.
// A missing or zero content-length fails with DownloadErrc::size_unknown.
[[nodiscard]] std::expected<ProbeResult, std::error_code>
probe(Transport& transport, const std::string& url, std::chrono::seconds timeout,
      const AbortCheck& should_abort = {}) noexcept;

} // namespace volley::core
