// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/segment_fetcher.hpp>
#include <splice/disk/file.hpp>
#include "support/memory_transport.hpp"
#include "support/temp_dir.hpp"
#include <atomic>
#include <thread>

using namespace splicer::core;
using namespace splicer::test;
using namespace std::chrono_literals;

namespace {

Url test_url() {
    return *Url::parse("http://example.com/data.bin");
}

} // namespace

TEST_CASE("Fetcher writes exactly its range", "[fetcher]") {
    TempDir dir;
    auto content = make_pattern(100'000);
    MemoryTransport transport(content);
    TransferControl control;

    Segment seg(SegmentSpan{1, 25'000, 49'999});
    auto sink = splicer::disk::File::create((dir / "segment_1").string());
    REQUIRE(sink.has_value());

    SegmentFetcher fetcher(transport, control);
    auto result = fetcher.fetch(seg, test_url(), *sink);
    sink->close();

    CHECK(result.ok());
    CHECK(result.index == 1);
    CHECK(seg.state() == SegmentState::complete);
    CHECK(seg.downloaded() == 25'000);

    auto written = read_file(dir / "segment_1");
    REQUIRE(written.size() == 25'000);
    CHECK(std::equal(written.begin(), written.end(), content.begin() + 25'000));

    auto ranges = transport.requested_ranges();
    REQUIRE(ranges.size() == 1);
    REQUIRE(ranges[0].has_value());
    CHECK(ranges[0]->first == 25'000);
    CHECK(ranges[0]->last == 49'999);
}

TEST_CASE("Fetcher splits large deliveries into chunks", "[fetcher]") {
    TempDir dir;
    MemoryTransport transport(make_pattern(64 * 1024));
    transport.chunk_size(64 * 1024);
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, std::nullopt});
    auto sink = splicer::disk::File::create((dir / "out").string());
    REQUIRE(sink.has_value());

    std::vector<std::uint64_t> observed;
    SegmentFetcher fetcher(transport, control);
    fetcher.chunk_observer([&](std::uint64_t bytes) { observed.push_back(bytes); });

    auto result = fetcher.fetch(seg, test_url(), *sink);
    CHECK(result.ok());
    CHECK(observed.size() == (64 * 1024) / CHUNK_SIZE);
    CHECK(std::is_sorted(observed.begin(), observed.end()));
    CHECK(observed.back() == 64 * 1024);
    CHECK_FALSE(transport.requested_ranges().at(0).has_value());
}

TEST_CASE("Fetcher reports transport failure", "[fetcher]") {
    TempDir dir;
    MemoryTransport transport(make_pattern(40'000));
    transport.fail_attempts(1);
    TransferControl control;
    REQUIRE(transport.probe(test_url(), {}).has_value());

    Segment seg(SegmentSpan{0, 0, 39'999});
    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentFetcher fetcher(transport, control);
    auto result = fetcher.fetch(seg, test_url(), *sink);

    CHECK(result.outcome == SegmentOutcome::failed);
    CHECK(result.error == DownloadErrc::connection_lost);
    CHECK(seg.state() == SegmentState::failed);
}

TEST_CASE("Fetcher rejects an ignored range", "[fetcher]") {
    TempDir dir;
    MemoryTransport transport(make_pattern(40'000));
    transport.ignore_range(true);
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, 19'999});
    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentFetcher fetcher(transport, control);
    auto result = fetcher.fetch(seg, test_url(), *sink);

    CHECK(result.outcome == SegmentOutcome::failed);
    CHECK(result.error == DownloadErrc::range_not_honored);
}

TEST_CASE("Fetcher detects a short transfer", "[fetcher]") {
    TempDir dir;
    // Resource shorter than the planned range
    MemoryTransport transport(make_pattern(10'000));
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, 19'999});
    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentFetcher fetcher(transport, control);
    auto result = fetcher.fetch(seg, test_url(), *sink);

    CHECK(result.outcome == SegmentOutcome::failed);
    CHECK(result.error == DownloadErrc::short_transfer);
}

TEST_CASE("Fetcher stops on cancel", "[fetcher]") {
    TempDir dir;
    MemoryTransport transport(make_pattern(2 * 1024 * 1024));
    transport.chunk_delay(2ms);
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, 2 * 1024 * 1024 - 1});
    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentResult result;
    std::thread worker([&] {
        SegmentFetcher fetcher(transport, control);
        result = fetcher.fetch(seg, test_url(), *sink);
    });

    while (seg.downloaded() == 0) std::this_thread::sleep_for(1ms);
    control.cancel();
    worker.join();

    CHECK(result.outcome == SegmentOutcome::cancelled);
    CHECK(seg.state() == SegmentState::pending);
    CHECK(seg.downloaded() < 2 * 1024 * 1024);
}

TEST_CASE("Fetcher parks while paused", "[fetcher]") {
    TempDir dir;
    const std::size_t size = 1024 * 1024;
    auto content = make_pattern(size);
    MemoryTransport transport(content);
    transport.chunk_delay(1ms);
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, size - 1});
    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentResult result;
    std::thread worker([&] {
        SegmentFetcher fetcher(transport, control);
        result = fetcher.fetch(seg, test_url(), *sink);
    });

    while (seg.downloaded() == 0) std::this_thread::sleep_for(1ms);
    control.pause();
    while (seg.state() != SegmentState::paused) std::this_thread::sleep_for(1ms);

    const auto parked_at = seg.downloaded();
    std::this_thread::sleep_for(50ms);
    CHECK(seg.downloaded() == parked_at);

    control.resume();
    worker.join();
    sink->close();

    CHECK(result.ok());
    CHECK(seg.downloaded() == size);
    CHECK(read_file(dir / "s") == content);
}

TEST_CASE("Fetcher restarts a segment from zero", "[fetcher]") {
    TempDir dir;
    MemoryTransport transport(make_pattern(30'000));
    TransferControl control;

    Segment seg(SegmentSpan{0, 0, 29'999});
    seg.add_downloaded(12'345);

    auto sink = splicer::disk::File::create((dir / "s").string());
    REQUIRE(sink.has_value());

    SegmentFetcher fetcher(transport, control);
    auto result = fetcher.fetch(seg, test_url(), *sink);
    CHECK(result.ok());
    CHECK(seg.downloaded() == 30'000);
}
