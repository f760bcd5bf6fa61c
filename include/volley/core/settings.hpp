// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/download_engine.hpp>
#include <volley/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace volley::core {

// User settings, stored as JSON:
//
//   {
//     "default_segments": 8,
//     "max_segments": 16,
//     "bandwidth_limit": 0,
//     "timeout_sec": 30,
//     "download_dir": "/home/me/Downloads"
//   }
//
// Keys that are missing keep their defaults.
struct Settings {
    std::uint32_t default_segments{DEFAULT_SEGMENTS};
    std::uint32_t max_segments{MAX_SEGMENTS};
    std::uint64_t bandwidth_limit{0};       // Bytes/s, 0 = unlimited. Not enforced.
    std::uint32_t timeout_sec{PROBE_TIMEOUT_SEC};
    std::string download_dir{"."};

    // Fails with DownloadErrc::invalid_settings on malformed JSON, wrong
    // types or out-of-range values, DiskErrc on I/O errors
    [[nodiscard]] static std::expected<Settings, std::error_code> load(std::string_view path) noexcept;
    [[nodiscard]] static std::expected<Settings, std::error_code> parse(std::string_view json) noexcept;

    // Write pretty-printed JSON, creating parent directories
    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    [[nodiscard]] std::string to_json() const;

    // $XDG_CONFIG_HOME/volley/settings.json, else $HOME/.config/volley/settings.json.
    // Empty if neither variable is set.
    [[nodiscard]] static std::string default_path();

    // Engine tunables derived from these settings
    [[nodiscard]] DownloadConfig download_config() const noexcept;
};

} // namespace volley::core
