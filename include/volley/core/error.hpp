// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace volley::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    size_unknown,
    bad_status,
    segment_failed,
    merge_failed,
    cancelled,
    aborted,
    too_many_redirects,
    ssl_error,
    dns_error,
    connection_lost,
    invalid_settings,
    unknown_transfer,
    already_started,
    not_started,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "volley::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::size_unknown:         return "Could not determine file size";
            case DownloadErrc::bad_status:           return "Unexpected HTTP status";
            case DownloadErrc::segment_failed:       return "Segment download failed";
            case DownloadErrc::merge_failed:         return "Merging segments failed";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::aborted:              return "Transfer aborted";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::invalid_settings:     return "Invalid settings file";
            case DownloadErrc::unknown_transfer:     return "Unknown transfer id";
            case DownloadErrc::already_started:      return "Transfer already started";
            case DownloadErrc::not_started:          return "Transfer not started";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace volley::core

namespace std {

template<>
struct is_error_code_enum<volley::core::DownloadErrc> : true_type {};

} // namespace std
