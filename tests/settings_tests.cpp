// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/settings.hpp>
#include <volley/disk/error.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace volley::core;

namespace fs = std::filesystem;

TEST_CASE("Settings defaults", "[settings]") {
    Settings s;
    CHECK(s.default_segments == 8);
    CHECK(s.max_segments == 16);
    CHECK(s.bandwidth_limit == 0);
    CHECK(s.timeout_sec == 30);

    auto config = s.download_config();
    CHECK(config.max_segments == 16);
    CHECK(config.probe_timeout == std::chrono::seconds{30});
    CHECK(config.min_segment_size == MIN_SEGMENT_SIZE);
}

TEST_CASE("Settings::parse", "[settings]") {
    SECTION("Missing keys keep defaults") {
        auto s = Settings::parse(R"({"max_segments": 4})");
        REQUIRE(s.has_value());
        CHECK(s->max_segments == 4);
        CHECK(s->default_segments == 8);
        CHECK(s->download_dir == ".");
    }

    SECTION("All keys") {
        auto s = Settings::parse(R"({
            "default_segments": 6,
            "max_segments": 12,
            "bandwidth_limit": 1048576,
            "timeout_sec": 10,
            "download_dir": "/data/downloads"
        })");
        REQUIRE(s.has_value());
        CHECK(s->default_segments == 6);
        CHECK(s->max_segments == 12);
        CHECK(s->bandwidth_limit == 1048576);
        CHECK(s->timeout_sec == 10);
        CHECK(s->download_dir == "/data/downloads");
        CHECK(s->download_config().bandwidth_limit == 1048576);
    }

    SECTION("Malformed JSON") {
        auto s = Settings::parse("{ not json");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == DownloadErrc::invalid_settings);
    }

    SECTION("Wrong type") {
        auto s = Settings::parse(R"({"download_dir": 42})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == DownloadErrc::invalid_settings);
    }

    SECTION("Zero segment count") {
        CHECK_FALSE(Settings::parse(R"({"default_segments": 0})").has_value());
    }

    SECTION("Negative values") {
        auto s = Settings::parse(R"({"max_segments": -1})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == DownloadErrc::invalid_settings);
        CHECK_FALSE(Settings::parse(R"({"timeout_sec": -5})").has_value());
        CHECK_FALSE(Settings::parse(R"({"bandwidth_limit": -1})").has_value());
    }

    SECTION("Fractional and oversized values") {
        CHECK_FALSE(Settings::parse(R"({"default_segments": 2.5})").has_value());
        CHECK_FALSE(Settings::parse(R"({"timeout_sec": 4294967296})").has_value());
    }

    SECTION("Segment counts are capped") {
        auto s = Settings::parse(R"({"default_segments": 64, "max_segments": 100000})");
        REQUIRE(s.has_value());
        CHECK(s->max_segments == MAX_SEGMENTS);
        CHECK(s->default_segments == MAX_SEGMENTS);
        CHECK(s->download_config().max_segments == MAX_SEGMENTS);
    }

    SECTION("Not an object") {
        CHECK_FALSE(Settings::parse("[1, 2, 3]").has_value());
    }
}

TEST_CASE("Settings save and load", "[settings]") {
    auto dir = fs::temp_directory_path() / "volley_settings_test";
    fs::remove_all(dir);
    auto path = (dir / "nested" / "settings.json").string();

    Settings original;
    original.default_segments = 4;
    original.download_dir = "/srv/files";

    REQUIRE_FALSE(original.save(path));
    REQUIRE(fs::exists(path));

    auto loaded = Settings::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->default_segments == 4);
    CHECK(loaded->max_segments == original.max_segments);
    CHECK(loaded->download_dir == "/srv/files");

    SECTION("Missing file") {
        auto missing = Settings::load((dir / "absent.json").string());
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == volley::disk::DiskErrc::file_not_found);
    }

    fs::remove_all(dir);
}

TEST_CASE("Settings::default_path", "[settings]") {
    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old_xdg ? old_xdg : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    CHECK(Settings::default_path() == "/tmp/xdg/volley/settings.json");

    if (old_xdg) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}
