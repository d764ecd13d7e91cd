// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/segment.hpp>

using namespace splicer::core;

TEST_CASE("Segment construction", "[segment]") {
    Segment seg(SegmentSpan{2, 1000, 1499});

    CHECK(seg.index() == 2);
    CHECK(seg.start_byte() == 1000);
    CHECK(seg.end_byte() == 1499u);
    CHECK(seg.bounded());
    CHECK(seg.length() == 500u);
    CHECK(seg.state() == SegmentState::pending);
    CHECK(seg.downloaded() == 0);
}

TEST_CASE("Segment counts downloaded bytes", "[segment]") {
    Segment seg(SegmentSpan{0, 0, 999});

    seg.add_downloaded(300);
    seg.add_downloaded(200);
    CHECK(seg.downloaded() == 500);
    CHECK(seg.progress().downloaded_bytes == 500);
}

TEST_CASE("Segment unbounded span", "[segment]") {
    Segment seg(SegmentSpan{0, 0, std::nullopt});

    CHECK_FALSE(seg.bounded());
    CHECK_FALSE(seg.length().has_value());
    seg.add_downloaded(4096);
    CHECK(seg.downloaded() == 4096);
    CHECK_FALSE(seg.progress().end_byte.has_value());
}

TEST_CASE("Segment::reset clears progress", "[segment]") {
    Segment seg(SegmentSpan{1, 100, 199});
    seg.add_downloaded(60);
    seg.state(SegmentState::failed);

    seg.reset();

    CHECK(seg.downloaded() == 0);
    CHECK(seg.state() == SegmentState::pending);
}

TEST_CASE("Segment::progress snapshot", "[segment]") {
    Segment seg(SegmentSpan{3, 300, 399});
    seg.add_downloaded(25);
    seg.state(SegmentState::in_flight);

    auto p = seg.progress();
    CHECK(p.index == 3);
    CHECK(p.start_byte == 300);
    CHECK(p.end_byte == 399u);
    CHECK(p.downloaded_bytes == 25);
    CHECK(p.state == SegmentState::in_flight);
}

TEST_CASE("SegmentState names", "[segment]") {
    CHECK(to_string(SegmentState::pending) == "pending");
    CHECK(to_string(SegmentState::in_flight) == "in-flight");
    CHECK(to_string(SegmentState::complete) == "complete");
}
