// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/core/http_session.hpp>
#include <volley/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace volley::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void volley_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(volley_terminate_handler);

    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    volley::log::init(args.verbose ? spdlog::level::debug
                      : args.quiet ? spdlog::level::warn
                                   : spdlog::level::info);

    auto settings = load_settings(args);
    if (!settings) {
        std::cerr << "Error: Cannot load settings " << args.config_path << ": "
                  << settings.error().message() << std::endl;
        return 1;
    }

    volley::core::HttpSession::global_init();
    install_signal_handlers();

    int exit_code = 0;
    for (const auto& url : args.urls) {
        // Ctrl-C ends the whole batch
        if (interrupted()) {
            exit_code = 1;
            break;
        }
        auto result = args.info_only ? info(url, *settings) : download(url, *settings, args);
        if (!result || *result != 0) {
            exit_code = 1;
        }
    }

    volley::core::HttpSession::global_cleanup();
    return exit_code;
}
