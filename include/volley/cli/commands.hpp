// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/settings.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace volley::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::vector<std::string> errors;  // Unknown options, missing values
    std::string output_dir;
    std::string config_path;
    std::uint32_t segments{0};        // 0 = settings default
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings from args.config_path, else the default path, else built-in
// defaults. Only an explicitly given file that fails to load is an error.
[[nodiscard]] std::expected<core::Settings, std::error_code> load_settings(const CliArgs& args) noexcept;

// Download a single URL. SIGINT cancels, SIGUSR1 pauses, SIGUSR2 resumes.
[[nodiscard]] CliResult download(const std::string& url,
                                 const core::Settings& settings,
                                 const CliArgs& args) noexcept;

// Probe a URL without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::Settings& settings) noexcept;

// Route SIGINT/SIGUSR1/SIGUSR2 to the active transfer
void install_signal_handlers() noexcept;

// Drop signals that have not been forwarded yet. download() calls this first.
void clear_signal_requests() noexcept;

[[nodiscard]] bool signal_pending() noexcept;

// True once SIGINT arrived, until the next clear_signal_requests()
[[nodiscard]] bool interrupted() noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace volley::cli
