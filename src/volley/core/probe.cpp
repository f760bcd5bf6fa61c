// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/probe.hpp>

namespace volley::core {

std::expected<ProbeResult, std::error_code>
probe(Transport& transport, const std::string& url, std::chrono::seconds timeout,
      const AbortCheck& should_abort) noexcept {
    auto head = transport.head(url, timeout, should_abort);
    if (!head) {
        return std::unexpected(head.error());
    }

    if (head->content_length == 0) {
        return std::unexpected(make_error_code(DownloadErrc::size_unknown));
    }

    ProbeResult result;
    result.total_size = head->content_length;
    result.supports_ranges = head->accepts_ranges;
    result.content_type = std::move(head->content_type);
    result.filename = std::move(head->filename);
    return result;
}

} // namespace volley::core
