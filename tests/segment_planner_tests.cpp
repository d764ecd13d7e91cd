// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/segment_planner.hpp>
#include <splice/core/config.hpp>
#include <algorithm>

using namespace splicer::core;

namespace {

// Spans must tile [0, size) without gaps or overlaps
void check_tiling(const std::vector<SegmentSpan>& plan, std::uint64_t size) {
    REQUIRE(!plan.empty());
    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        CHECK(plan[i].index == i);
        CHECK(plan[i].start_byte == expected_start);
        REQUIRE(plan[i].end_byte.has_value());
        CHECK(*plan[i].end_byte >= plan[i].start_byte);
        expected_start = *plan[i].end_byte + 1;
    }
    CHECK(expected_start == size);
}

} // namespace

TEST_CASE("Planner splits evenly", "[planner]") {
    auto plan = plan_segments(10'000'000, true, 4);

    REQUIRE(plan.size() == 4);
    check_tiling(plan, 10'000'000);
    CHECK(plan[0] == SegmentSpan{0, 0, 2'499'999});
    CHECK(plan[3] == SegmentSpan{3, 7'500'000, 9'999'999});
}

TEST_CASE("Planner gives the remainder to the last segment", "[planner]") {
    auto plan = plan_segments(10'000'003, true, 4);

    REQUIRE(plan.size() == 4);
    check_tiling(plan, 10'000'003);
    CHECK(plan[0].length() == 2'500'000u);
    CHECK(plan[3].length() == 2'500'003u);
}

TEST_CASE("Planner falls back to a single stream", "[planner]") {
    SECTION("Unknown size") {
        auto plan = plan_segments(std::nullopt, true, 8);
        REQUIRE(plan.size() == 1);
        CHECK_FALSE(plan[0].bounded());
        CHECK(is_single_stream(plan));
    }

    SECTION("Ranges unsupported") {
        auto plan = plan_segments(50'000'000, false, 8);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].start_byte == 0);
        CHECK(is_single_stream(plan));
    }

    SECTION("At the threshold") {
        auto plan = plan_segments(SINGLE_SEGMENT_THRESHOLD, true, 8);
        CHECK(is_single_stream(plan));
    }

    SECTION("Just above the threshold") {
        auto plan = plan_segments(SINGLE_SEGMENT_THRESHOLD + 1, true, 8);
        CHECK(plan.size() == 8);
        CHECK_FALSE(is_single_stream(plan));
        check_tiling(plan, SINGLE_SEGMENT_THRESHOLD + 1);
    }

    SECTION("Empty resource") {
        auto plan = plan_segments(0, true, 4);
        CHECK(is_single_stream(plan));
    }
}

TEST_CASE("Planner clamps the segment count", "[planner]") {
    CHECK(plan_segments(100'000'000, true, 64).size() == MAX_SEGMENTS);
    CHECK(plan_segments(100'000'000, true, 0).size() == MIN_SEGMENTS);
    CHECK(plan_segments(100'000'000, true, 16).size() == 16);
}

TEST_CASE("Planner honours a custom threshold", "[planner]") {
    auto plan = plan_segments(10'000, true, 4, 1'000);
    REQUIRE(plan.size() == 4);
    check_tiling(plan, 10'000);
}

TEST_CASE("Single bounded segment is not a single stream", "[planner]") {
    auto plan = plan_segments(5'000'000, true, 1);
    REQUIRE(plan.size() == 1);
    CHECK(plan[0].bounded());
    CHECK_FALSE(is_single_stream(plan));
    check_tiling(plan, 5'000'000);
}

TEST_CASE("Planner tiles every segment count", "[planner]") {
    for (std::uint32_t n = MIN_SEGMENTS; n <= MAX_SEGMENTS; ++n) {
        for (std::uint64_t size : {SINGLE_SEGMENT_THRESHOLD + 1, SINGLE_SEGMENT_THRESHOLD + n + 7,
                                   std::uint64_t{10'000'019}, std::uint64_t{4'294'967'311}}) {
            INFO("segments " << n << ", size " << size);
            auto plan = plan_segments(size, true, n);
            CHECK(plan.size() == n);
            check_tiling(plan, size);
        }
    }
}

TEST_CASE("Planner never plans empty segments", "[planner]") {
    SECTION("Fewer bytes than requested segments") {
        auto plan = plan_segments(3, true, 4, 0);
        REQUIRE(plan.size() == 3);
        check_tiling(plan, 3);
        for (const auto& span : plan) {
            CHECK(span.length() == 1u);
        }
    }

    SECTION("Every count over tiny resources") {
        for (std::uint32_t n = MIN_SEGMENTS; n <= MAX_SEGMENTS; ++n) {
            for (std::uint64_t size = 1; size <= 20; ++size) {
                INFO("segments " << n << ", size " << size);
                auto plan = plan_segments(size, true, n, 0);
                CHECK(plan.size() == std::min<std::uint64_t>(n, size));
                check_tiling(plan, size);
            }
        }
    }
}
