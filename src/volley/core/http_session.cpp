// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/http_session.hpp>
#include <volley/core/config.hpp>
#include <volley/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <new>
#include <string>

namespace volley::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::error_code curl_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_CONNECT:         return make_error_code(DownloadErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:             return make_error_code(DownloadErrc::connection_lost);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:           return make_error_code(DownloadErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:     return make_error_code(DownloadErrc::aborted);
        default:                            return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code status_to_error_code(long http_code) noexcept {
    if (http_code == 404) return make_error_code(DownloadErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::bad_status);
}

// Header callback. A new status line starts a new response (redirects), so
// only the headers of the final response survive.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the GET callbacks of one get_range() call
struct RangeContext {
    CURL* curl{nullptr};
    const RangeFetch* fetch{nullptr};
    bool status_checked{false};
    bool rejected{false};   // Final status was not 200/206
    bool stopped{false};    // Sink asked to stop
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<RangeContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!ctx->status_checked) {
        ctx->status_checked = true;
        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 200 && http_code != 206) {
            ctx->rejected = true;
            return 0;
        }
    }

    if (!ctx->fetch->on_data || !ctx->fetch->on_data(ptr, bytes)) {
        ctx->stopped = true;
        return 0;  // Anything other than `bytes` aborts the transfer
    }
    return bytes;
}

// Lets a cancel interrupt a worker that is waiting on the network
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<RangeContext*>(userdata);
    const auto& check = ctx->fetch->should_abort;
    return (check && check()) ? 1 : 0;
}

int head_xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    const auto* check = static_cast<const AbortCheck*>(userdata);
    return (*check && (*check)()) ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, std::chrono::seconds timeout, const AbortCheck& should_abort) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        HttpResponse response{};

        apply_common_options(curl.ptr, url);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, head_xferinfo_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &should_abort);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result == CURLE_ABORTED_BY_CALLBACK) {
            return std::unexpected(make_error_code(DownloadErrc::aborted));
        }
        if (result != CURLE_OK) {
            log::get()->debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error_code(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);
        if (http_code >= 400) {
            log::get()->debug("HEAD {} returned status {}", url, http_code);
            return std::unexpected(status_to_error_code(http_code));
        }

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not reliable for HEAD, read the header
        auto cl_it = response.headers.find("content-length");
        if (cl_it != response.headers.end() && !cl_it->second.empty()) {
            char* end = nullptr;
            unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
            if (end == cl_it->second.c_str() + cl_it->second.size()) {
                response.content_length = static_cast<std::uint64_t>(val);
            }
        }

        auto ct_it = response.headers.find("content-type");
        if (ct_it != response.headers.end()) {
            response.content_type = ct_it->second;
        }

        auto ar_it = response.headers.find("accept-ranges");
        response.accepts_ranges = (ar_it != response.headers.end() && ar_it->second == "bytes");

        response.filename = extract_filename(response.headers);

        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::expected<std::int32_t, std::error_code>
HttpSession::get_range(const RangeFetch& fetch) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        RangeContext ctx;
        ctx.curl = curl.ptr;
        ctx.fetch = &fetch;

        apply_common_options(curl.ptr, fetch.url);

        std::string range = std::to_string(fetch.first) + "-" + std::to_string(fetch.last);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        // Body arrives in increments of at most READ_BUFFER_SIZE
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

        CURLcode result = curl_easy_perform(curl.ptr);

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

        if (ctx.rejected) {
            return static_cast<std::int32_t>(http_code);
        }
        if (ctx.stopped || result == CURLE_ABORTED_BY_CALLBACK) {
            return std::unexpected(make_error_code(DownloadErrc::aborted));
        }
        if (result != CURLE_OK) {
            log::get()->debug("GET {} bytes={} failed: {}", fetch.url, range, curl_easy_strerror(result));
            return std::unexpected(curl_to_error_code(result));
        }

        return static_cast<std::int32_t>(http_code);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::string HttpSession::extract_filename(const std::map<std::string, std::string>& headers) {
    auto it = headers.find("content-disposition");
    if (it != headers.end() && !it->second.empty()) {
        return parse_content_disposition(it->second);
    }
    return {};
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // Parse "attachment; filename=file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }

    auto filename = content_disposition.substr(filename_pos + 9);
    auto semicolon = filename.find(';');
    if (semicolon != std::string_view::npos) {
        filename = filename.substr(0, semicolon);
    }
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')
        && filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace volley::core
