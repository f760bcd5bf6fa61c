// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/segment_plan.hpp>

using namespace volley::core;

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

// Contiguous, non-overlapping, covering [0, total)
void check_covers(const std::vector<SegmentRange>& plan, std::uint64_t total) {
    REQUIRE_FALSE(plan.empty());
    CHECK(plan.front().first == 0);
    CHECK(plan.back().last == total - 1);

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        CHECK(plan[i].index == i);
        CHECK(plan[i].first <= plan[i].last);
        if (i > 0) {
            CHECK(plan[i].first == plan[i - 1].last + 1);
        }
        sum += plan[i].size();
    }
    CHECK(sum == total);
}

} // namespace

TEST_CASE("split_ranges", "[segment]") {
    SECTION("10 MiB in 4 equal segments") {
        auto plan = split_ranges(10 * MiB, 4);
        REQUIRE(plan.size() == 4);
        for (const auto& range : plan) {
            CHECK(range.size() == 2'621'440);
        }
        CHECK(plan[1] == SegmentRange{1, 2'621'440, 5'242'879});
        check_covers(plan, 10 * MiB);
    }

    SECTION("Last segment absorbs the remainder") {
        auto plan = split_ranges(10, 3);
        REQUIRE(plan.size() == 3);
        CHECK(plan[0].size() == 3);
        CHECK(plan[1].size() == 3);
        CHECK(plan[2].size() == 4);
        check_covers(plan, 10);
    }

    SECTION("More segments than bytes") {
        auto plan = split_ranges(3, 8);
        REQUIRE(plan.size() == 3);
        check_covers(plan, 3);
    }

    SECTION("Degenerate inputs") {
        CHECK(split_ranges(0, 4).empty());
        CHECK(split_ranges(100, 0).empty());
    }
}

TEST_CASE("effective_segment_count", "[segment]") {
    SECTION("Small file collapses to one segment") {
        CHECK(effective_segment_count(500'000, 8, true) == 1);
    }

    SECTION("Floor of 1 MiB per segment") {
        // 3.5 MiB / 8 is below the floor, so only 3 segments fit
        CHECK(effective_segment_count(3 * MiB + MiB / 2, 8, true) == 3);
        CHECK(effective_segment_count(64 * MiB, 8, true) == 8);
    }

    SECTION("No range support forces one segment") {
        CHECK(effective_segment_count(1024 * MiB, 8, false) == 1);
        CHECK(effective_segment_count(1024 * MiB, 16, false) == 1);
    }

    SECTION("Requested count is clamped") {
        CHECK(effective_segment_count(1024 * MiB, 0, true) == 1);
        CHECK(effective_segment_count(1024 * MiB, 64, true) == MAX_SEGMENTS);
        CHECK(effective_segment_count(1024 * MiB, 12, true, 4) == 4);
    }

    SECTION("Custom floor") {
        CHECK(effective_segment_count(1000, 4, true, MAX_SEGMENTS, 100) == 4);
        CHECK(effective_segment_count(250, 4, true, MAX_SEGMENTS, 100) == 2);
    }
}

TEST_CASE("plan_segments properties", "[segment]") {
    auto [total, requested] = GENERATE(table<std::uint64_t, std::uint32_t>({
        {1, 1},
        {MiB, 4},
        {10 * MiB, 4},
        {10 * MiB + 7, 3},
        {100 * MiB + 1, 16},
        {5 * MiB - 1, 8},
    }));

    auto plan = plan_segments(total, requested, true);
    CAPTURE(total, requested);
    check_covers(plan, total);
    CHECK(plan.size() <= requested);
    if (plan.size() > 1) {
        for (const auto& range : plan) {
            CHECK(range.size() >= MIN_SEGMENT_SIZE);
        }
    }
}
