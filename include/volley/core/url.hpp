// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace volley::core {

// File name used when a URL has no path component
constexpr std::string_view DEFAULT_FILENAME = "download";

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // The URL exactly as it was given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    // Last path component, or DEFAULT_FILENAME when there is none
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Destination path for a download: <directory>/<url filename>
[[nodiscard]] std::string resolve_destination(std::string_view directory, const Url& url);

} // namespace volley::core
