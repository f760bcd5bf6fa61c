// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/transport.hpp>
#include <map>
#include <string>
#include <string_view>

namespace volley::core {

// libcurl implementation of Transport. Every request uses its own easy
// handle, so one session can be shared by all workers of all transfers.
class HttpSession final : public Transport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::chrono::seconds timeout, const AbortCheck& should_abort) noexcept override;

    [[nodiscard]] std::expected<std::int32_t, std::error_code>
    get_range(const RangeFetch& fetch) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

private:
    // Extract filename from headers
    static std::string extract_filename(const std::map<std::string, std::string>& headers);
};

} // namespace volley::core
