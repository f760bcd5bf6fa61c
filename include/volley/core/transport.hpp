// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <string>

namespace volley::core {

// HTTP response metadata
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-cased names, final response only
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename; // From Content-Disposition
};

// Receives one read increment of a response body. Return false to abort.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

// Polled while waiting on the network. Return true to abort.
using AbortCheck = std::function<bool()>;

// A GET restricted to bytes [first, last]
struct RangeFetch {
    std::string url;
    std::uint64_t first{0};
    std::uint64_t last{0};
    BodySink on_data;
    AbortCheck should_abort;
};

// The network seam used by the probe and the range workers
class Transport {
public:
    virtual ~Transport() = default;

    // Metadata-only request bounded by `timeout`. Fails with
    // DownloadErrc::aborted once should_abort returns true.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::chrono::seconds timeout, const AbortCheck& should_abort) noexcept = 0;

    // Ranged GET. The body is delivered to fetch.on_data only when the final
    // status is 200 or 206; any other status is returned without touching the
    // sink. Fails with DownloadErrc::aborted when the sink or should_abort
    // stopped the transfer.
    [[nodiscard]] virtual std::expected<std::int32_t, std::error_code>
    get_range(const RangeFetch& fetch) noexcept = 0;
};

} // namespace volley::core
