// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/segment_fetcher.hpp>
#include <splice/core/config.hpp>
#include <splice/core/log.hpp>
#include <algorithm>

namespace splicer::core {

bool SegmentFetcher::checkpoint(Segment& segment) noexcept {
    if (control_.cancelled()) return false;
    if (control_.paused()) {
        segment.state(SegmentState::paused);
        const bool resumed = control_.wait_while_paused();
        if (!resumed) return false;
        segment.state(SegmentState::in_flight);
    }
    return true;
}

SegmentResult SegmentFetcher::fetch(Segment& segment, const Url& url, disk::File& sink) noexcept {
    SegmentResult result{segment.index(), SegmentOutcome::failed, {}};

    segment.reset();
    if (!checkpoint(segment)) {
        segment.state(SegmentState::pending);
        result.outcome = SegmentOutcome::cancelled;
        return result;
    }
    segment.state(SegmentState::in_flight);

    std::optional<ByteRange> range;
    if (segment.bounded()) {
        range = ByteRange{segment.start_byte(), *segment.end_byte()};
    }

    std::error_code sink_error;
    const auto on_data = [&](std::span<const std::byte> data) -> bool {
        while (!data.empty()) {
            const std::size_t n = std::min(data.size(), CHUNK_SIZE);
            if (auto ec = sink.write(data.data(), n)) {
                sink_error = ec;
                return false;
            }
            segment.add_downloaded(n);
            data = data.subspan(n);

            if (observer_) {
                try {
                    observer_(segment.downloaded());
                } catch (const std::exception& e) {
                    log()->warn("segment {} progress observer threw: {}", segment.index(), e.what());
                }
            }
            if (!checkpoint(segment)) return false;
        }
        return true;
    };
    const AbortCheck abort = [this] { return control_.cancelled(); };

    const std::error_code ec = transport_.fetch(url, range, on_data, abort);

    if (control_.cancelled()) {
        segment.state(SegmentState::pending);
        result.outcome = SegmentOutcome::cancelled;
        return result;
    }

    auto fail = [&](std::error_code error) {
        segment.state(SegmentState::failed);
        result.error = error;
        log()->warn("segment {} failed after {} bytes: {}", segment.index(), segment.downloaded(),
                    error.message());
        return result;
    };

    if (sink_error) return fail(sink_error);
    if (ec) return fail(ec);
    if (auto flush_ec = sink.flush()) return fail(flush_ec);

    if (auto length = segment.length()) {
        if (segment.downloaded() < *length) {
            return fail(make_error_code(DownloadErrc::short_transfer));
        }
        if (segment.downloaded() > *length) {
            return fail(make_error_code(DownloadErrc::invalid_range));
        }
    }

    segment.state(SegmentState::complete);
    result.outcome = SegmentOutcome::complete;
    log()->debug("segment {} complete ({} bytes)", segment.index(), segment.downloaded());
    return result;
}

} // namespace splicer::core
