// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/segment.hpp>

namespace splicer::core {

std::string_view to_string(SegmentState state) noexcept {
    switch (state) {
        case SegmentState::pending:   return "pending";
        case SegmentState::in_flight: return "in-flight";
        case SegmentState::paused:    return "paused";
        case SegmentState::complete:  return "complete";
        case SegmentState::failed:    return "failed";
    }
    return "unknown";
}

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(SegmentSpan span) noexcept
    : span_(span) {}

void Segment::reset() noexcept {
    downloaded_.store(0, std::memory_order_relaxed);
    state(SegmentState::pending);
}

SegmentProgress Segment::progress() const noexcept {
    return {span_.index, span_.start_byte, span_.end_byte, downloaded(), state()};
}

} // namespace splicer::core
