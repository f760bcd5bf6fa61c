// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/cli/progress_bar.hpp>
#include <volley/core/download_engine.hpp>
#include <volley/core/error.hpp>
#include <volley/core/format.hpp>
#include <volley/core/http_session.hpp>
#include <volley/core/log.hpp>
#include <volley/core/probe.hpp>
#include <volley/core/url.hpp>
#include <volley/disk/error.hpp>
#include <volley/version.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace volley::core;

namespace volley::cli {

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;
volatile std::sig_atomic_t g_pause_requested = 0;
volatile std::sig_atomic_t g_resume_requested = 0;
volatile std::sig_atomic_t g_interrupted = 0;  // SIGINT seen, stays set after forwarding

void on_signal(int signo) {
    switch (signo) {
        case SIGINT:  g_cancel_requested = 1; g_interrupted = 1; break;
        case SIGUSR1: g_pause_requested = 1; break;
        case SIGUSR2: g_resume_requested = 1; break;
        default: break;
    }
}

bool is_terminal(DownloadState state) noexcept {
    return state == DownloadState::completed
        || state == DownloadState::failed
        || state == DownloadState::cancelled;
}

// Forward pending signals to the transfer, once each
void forward_signals(DownloadManager& manager, const std::string& id) noexcept {
    if (g_cancel_requested) {
        g_cancel_requested = 0;
        manager.cancel(id);
    }
    if (g_pause_requested) {
        g_pause_requested = 0;
        manager.pause(id);
    }
    if (g_resume_requested) {
        g_resume_requested = 0;
        manager.resume(id);
    }
}

} // namespace

void clear_signal_requests() noexcept {
    g_cancel_requested = 0;
    g_pause_requested = 0;
    g_resume_requested = 0;
    g_interrupted = 0;
}

bool signal_pending() noexcept {
    return g_cancel_requested || g_pause_requested || g_resume_requested || g_interrupted;
}

bool interrupted() noexcept {
    return g_interrupted != 0;
}

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value = [&](int& i, const std::string& option) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.errors.push_back("Missing value for " + option);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (const char* v = value(i, arg)) {
                args.output_dir = v;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value(i, arg)) {
                args.config_path = v;
            }
        } else if (arg == "-n" || arg == "--segments") {
            if (const char* v = value(i, arg)) {
                char* end = nullptr;
                unsigned long n = std::strtoul(v, &end, 10);
                if (end == v || *end != '\0' || n == 0 || n > MAX_SEGMENTS) {
                    args.errors.push_back("Invalid segment count: " + std::string(v));
                } else {
                    args.segments = static_cast<std::uint32_t>(n);
                }
            }
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            args.urls.push_back(arg);
        } else {
            args.errors.push_back("Unknown argument: " + arg);
        }
    }

    return args;
}

std::expected<Settings, std::error_code> load_settings(const CliArgs& args) noexcept {
    if (!args.config_path.empty()) {
        return Settings::load(args.config_path);
    }

    auto path = Settings::default_path();
    if (path.empty()) {
        return Settings{};
    }

    auto settings = Settings::load(path);
    if (!settings) {
        if (settings.error() == disk::DiskErrc::file_not_found) {
            return Settings{};
        }
        log::get()->warn("Ignoring {}: {}", path, settings.error().message());
        return Settings{};
    }
    return settings;
}

//=============================================================================
// Commands
//=============================================================================

void install_signal_handlers() noexcept {
    struct sigaction action {};
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGUSR1, &action, nullptr);
    sigaction(SIGUSR2, &action, nullptr);
}

CliResult download(const std::string& url, const Settings& settings, const CliArgs& args) noexcept {
    auto logger = log::get();

    // A signal that arrived after the previous transfer ended belongs to nobody
    clear_signal_requests();

    HttpSession session;
    DownloadManager manager(session, settings.download_config());

    TransferRequest request;
    request.url = url;
    request.destination_dir = args.output_dir.empty() ? settings.download_dir : args.output_dir;
    request.segment_count = args.segments > 0 ? args.segments : settings.default_segments;

    ProgressBar bar("Downloading");
    EventHandlers handlers;
    if (!args.quiet) {
        handlers.on_progress = [&bar](const ProgressEvent& e) { bar.update(e); };
        handlers.on_status = [&bar](const StatusEvent& e) { bar.message(e.message); };
    }
    handlers.on_completed = [&logger](const CompletionEvent& e) {
        logger->debug("{} finished", e.transfer_id);
    };

    auto id = manager.create(std::move(request), std::move(handlers));
    if (!id) {
        std::cerr << "Error: Invalid URL: " << url << std::endl;
        return std::unexpected(id.error());
    }

    logger->debug("{}: {} -> {}", *id, url, args.output_dir.empty() ? settings.download_dir : args.output_dir);

    if (auto ec = manager.start(*id)) {
        std::cerr << "Error: Failed to start download: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    // Wait for completion, relaying signals from the main thread
    while (true) {
        auto state = manager.state(*id);
        if (!state || is_terminal(*state)) {
            break;
        }
        forward_signals(manager, *id);
        std::this_thread::sleep_for(PAUSE_POLL_INTERVAL);
    }

    auto outcome = manager.wait(*id);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    if (!args.quiet) {
        bar.finish();
    }

    switch (*outcome) {
        case TransferOutcome::completed:
            return 0;
        case TransferOutcome::cancelled:
            if (args.quiet) {
                std::cerr << "Download cancelled" << std::endl;
            }
            return 1;
        case TransferOutcome::failed:
            if (args.quiet) {
                std::cerr << "Error: Download failed" << std::endl;
            }
            return std::unexpected(make_error_code(DownloadErrc::segment_failed));
    }
    return 1;
}

CliResult info(const std::string& url, const Settings& settings) noexcept {
    HttpSession session;
    auto result = probe(session, url, std::chrono::seconds{settings.timeout_sec});

    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    auto parsed = Url::parse(url);
    std::string filename = !result->filename.empty()
        ? result->filename
        : (parsed ? parsed->filename() : std::string(DEFAULT_FILENAME));

    std::cout << "URL: " << url << std::endl;
    std::cout << "Filename: " << filename << std::endl;
    std::cout << "Content-Type: " << (result->content_type.empty() ? "unknown" : result->content_type) << std::endl;
    std::cout << "Content-Length: " << result->total_size
              << " (" << format_size(static_cast<double>(result->total_size)) << ")" << std::endl;
    std::cout << "Accepts-Ranges: " << (result->supports_ranges ? "yes" : "no") << std::endl;

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Volley " << program_name << " - Parallel segmented HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --segments <N>      Number of connections (1-" << MAX_SEGMENTS << ")\n";
    std::cout << "  -c, --config <FILE>     Read settings from FILE\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "\n";
    std::cout << "SIGNALS:\n";
    std::cout << "  SIGINT cancels, SIGUSR1 pauses, SIGUSR2 resumes the active download\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -d ~/Downloads https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 8 https://example.com/large.iso\n";
}

void print_version() noexcept {
    std::cout << "Volley " << volley::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with C++23, libcurl, spdlog\n";
}

} // namespace volley::cli
