// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/cli/commands.hpp>
#include <volley/cli/progress_bar.hpp>
#include <csignal>
#include <string>
#include <vector>

using namespace volley::cli;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    static std::string program = "volley";
    argv.push_back(program.data());
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("URLs and options") {
        auto args = parse({"-n", "4", "-d", "/tmp/dl", "https://example.com/a.iso", "http://example.com/b.iso"});
        CHECK(args.errors.empty());
        CHECK(args.segments == 4);
        CHECK(args.output_dir == "/tmp/dl");
        CHECK(args.urls == std::vector<std::string>{"https://example.com/a.iso", "http://example.com/b.iso"});
    }

    SECTION("Flags") {
        auto args = parse({"--verbose", "--info", "-c", "settings.json", "https://example.com/x"});
        CHECK(args.verbose);
        CHECK(args.info_only);
        CHECK_FALSE(args.quiet);
        CHECK(args.config_path == "settings.json");
    }

    SECTION("Help short-circuits") {
        auto args = parse({"--bogus", "-h"});
        CHECK(args.help);
    }

    SECTION("Bad segment counts") {
        CHECK_FALSE(parse({"-n", "0"}).errors.empty());
        CHECK_FALSE(parse({"-n", "17"}).errors.empty());
        CHECK_FALSE(parse({"-n", "four"}).errors.empty());
        CHECK_FALSE(parse({"-n"}).errors.empty());
    }

    SECTION("Unknown argument") {
        auto args = parse({"--turbo"});
        REQUIRE(args.errors.size() == 1);
        CHECK(args.errors[0] == "Unknown argument: --turbo");
    }
}

TEST_CASE("Signal requests", "[cli]") {
    install_signal_handlers();
    clear_signal_requests();
    CHECK_FALSE(signal_pending());

    SECTION("A latched pause is dropped before the next transfer") {
        REQUIRE(std::raise(SIGUSR1) == 0);
        CHECK(signal_pending());
        CHECK_FALSE(interrupted());
        clear_signal_requests();
        CHECK_FALSE(signal_pending());
    }

    SECTION("SIGINT marks the batch as interrupted") {
        REQUIRE(std::raise(SIGINT) == 0);
        CHECK(interrupted());
        clear_signal_requests();
        CHECK_FALSE(interrupted());
        CHECK_FALSE(signal_pending());
    }
}

TEST_CASE("ProgressBar::format_time", "[cli]") {
    CHECK(ProgressBar::format_time(0) == "0s");
    CHECK(ProgressBar::format_time(59) == "59s");
    CHECK(ProgressBar::format_time(61) == "1m 1s");
    CHECK(ProgressBar::format_time(3725) == "1h 02m 5s");
}
