// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/settings.hpp>
#include <volley/core/log.hpp>
#include <volley/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace volley::core {

namespace {

std::error_code invalid() noexcept {
    return make_error_code(DownloadErrc::invalid_settings);
}

// get<unsigned>() silently wraps negative numbers, so check the JSON type first
template<typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return true;
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned()
        || value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
        log::get()->debug("settings: {} must be a non-negative integer", key);
        return false;
    }
    out = value.get<T>();
    return true;
}

} // namespace

std::expected<Settings, std::error_code> Settings::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(invalid());
        }

        Settings s;
        if (!read_unsigned(j, "default_segments", s.default_segments)
            || !read_unsigned(j, "max_segments", s.max_segments)
            || !read_unsigned(j, "bandwidth_limit", s.bandwidth_limit)
            || !read_unsigned(j, "timeout_sec", s.timeout_sec)) {
            return std::unexpected(invalid());
        }
        if (j.contains("download_dir")) {
            s.download_dir = j["download_dir"].get<std::string>();
        }

        if (s.default_segments == 0 || s.max_segments == 0 || s.timeout_sec == 0) {
            return std::unexpected(invalid());
        }

        // Never more connections than the engine supports
        if (s.max_segments > MAX_SEGMENTS) {
            log::get()->warn("settings: max_segments {} capped at {}", s.max_segments, MAX_SEGMENTS);
            s.max_segments = MAX_SEGMENTS;
        }
        s.default_segments = std::min(s.default_segments, s.max_segments);
        return s;
    } catch (const nlohmann::json::exception& e) {
        log::get()->debug("settings: {}", e.what());
        return std::unexpected(invalid());
    }
}

std::expected<Settings, std::error_code> Settings::load(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return parse(buffer.str());
}

std::string Settings::to_json() const {
    nlohmann::json j;
    j["default_segments"] = default_segments;
    j["max_segments"] = max_segments;
    j["bandwidth_limit"] = bandwidth_limit;
    j["timeout_sec"] = timeout_sec;
    j["download_dir"] = download_dir;
    return j.dump(2);
}

std::error_code Settings::save(std::string_view path) const noexcept {
    std::filesystem::path target{std::string(path)};

    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error_code(disk::DiskErrc::invalid_path);
        }
    }

    std::ofstream file(target, std::ios::trunc);
    if (!file) {
        return make_error_code(disk::DiskErrc::access_denied);
    }
    file << to_json() << '\n';
    file.flush();
    if (!file) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return {};
}

std::string Settings::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "volley" / "settings.json").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".config" / "volley" / "settings.json").string();
    }
    return {};
}

DownloadConfig Settings::download_config() const noexcept {
    DownloadConfig config;
    config.max_segments = max_segments;
    config.probe_timeout = std::chrono::seconds{timeout_sec};
    config.bandwidth_limit = bandwidth_limit;
    return config;
}

} // namespace volley::core
