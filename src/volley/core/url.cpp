// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <new>

namespace volley::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        std::string lower_scheme;
        lower_scheme.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            lower_scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        url.scheme_ = std::move(lower_scheme);

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            // IPv6 literal [::1]:port
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            auto ipv6_colon = url_str.find(':', bracket_end);
            if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
                url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    std::string name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::string(DEFAULT_FILENAME);
    }
    return name;
}

std::string resolve_destination(std::string_view directory, const Url& url) {
    return (std::filesystem::path(directory) / url.filename()).string();
}

} // namespace volley::core
