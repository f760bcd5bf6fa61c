// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/disk/file_writer.hpp>
#include <volley/disk/merge.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace volley::disk;

namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("volley_merge_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("part_path naming", "[disk]") {
    CHECK(part_path("/tmp/file.iso", 0) == "/tmp/file.iso.part0");
    CHECK(part_path("/tmp/file.iso", 12) == "/tmp/file.iso.part12");
}

TEST_CASE("FileWriter appends and counts bytes", "[disk]") {
    auto dir = scratch_dir("writer");
    auto path = (dir / "out.bin").string();

    FileWriter writer;
    REQUIRE_FALSE(writer.open(path));
    CHECK(writer.is_open());
    CHECK_FALSE(writer.write("hello ", 6));
    CHECK_FALSE(writer.write("world", 5));
    CHECK(writer.bytes_written() == 11);
    CHECK_FALSE(writer.flush());
    writer.close();
    CHECK_FALSE(writer.is_open());

    CHECK(read_text(path) == "hello world");

    SECTION("Reopening truncates") {
        FileWriter again;
        REQUIRE_FALSE(again.open(path));
        again.close();
        CHECK(fs::file_size(path) == 0);
    }

    SECTION("Missing directory fails") {
        FileWriter bad;
        auto ec = bad.open((dir / "missing" / "x.bin").string());
        CHECK(ec == DiskErrc::file_not_found);
    }

    fs::remove_all(dir);
}

TEST_CASE("merge_parts concatenates in index order", "[disk]") {
    auto dir = scratch_dir("order");
    auto dest = (dir / "result.txt").string();

    write_text(part_path(dest, 0), "alpha-");
    write_text(part_path(dest, 1), "beta-");
    write_text(part_path(dest, 2), "gamma");

    SECTION("Success deletes every part") {
        REQUIRE_FALSE(merge_parts(dest, 3));
        CHECK(read_text(dest) == "alpha-beta-gamma");
        for (std::uint32_t i = 0; i < 3; ++i) {
            CHECK_FALSE(fs::exists(part_path(dest, i)));
        }
    }

    SECTION("Existing destination is overwritten") {
        write_text(dest, "stale content that is much longer than the merge result");
        REQUIRE_FALSE(merge_parts(dest, 3));
        CHECK(read_text(dest) == "alpha-beta-gamma");
    }

    SECTION("Missing part fails") {
        fs::remove(part_path(dest, 1));
        auto ec = merge_parts(dest, 3);
        CHECK(ec);
        CHECK(ec == DiskErrc::file_not_found);

        cleanup_parts(dest, 3);
        for (std::uint32_t i = 0; i < 3; ++i) {
            CHECK_FALSE(fs::exists(part_path(dest, i)));
        }
    }

    fs::remove_all(dir);
}

TEST_CASE("cleanup helpers never fail", "[disk]") {
    auto dir = scratch_dir("cleanup");
    auto dest = (dir / "nothing.bin").string();

    cleanup_parts(dest, 4);
    remove_file(dest);
    CHECK_FALSE(fs::exists(dest));

    write_text(dest, "x");
    remove_file(dest);
    CHECK_FALSE(fs::exists(dest));

    fs::remove_all(dir);
}
