// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/segment_planner.hpp>
#include <algorithm>

namespace splicer::core {

std::vector<SegmentSpan>
plan_segments(std::optional<std::uint64_t> total_size,
              bool supports_range,
              std::uint32_t requested_count,
              std::uint64_t threshold) {
    if (!total_size || *total_size <= threshold || !supports_range) {
        return {SegmentSpan{0, 0, std::nullopt}};
    }

    const std::uint64_t size = *total_size;
    // Every segment holds at least one byte
    const std::uint32_t count = static_cast<std::uint32_t>(std::min<std::uint64_t>(
        std::clamp(requested_count, MIN_SEGMENTS, MAX_SEGMENTS), size));
    const std::uint64_t seg_size = size / count;

    std::vector<SegmentSpan> spans;
    spans.reserve(count);

    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        const bool last = (i + 1 == count);
        const std::uint64_t end = last ? size - 1 : offset + seg_size - 1;
        spans.push_back(SegmentSpan{i, offset, end});
        offset = end + 1;
    }

    return spans;
}

bool is_single_stream(const std::vector<SegmentSpan>& plan) noexcept {
    return plan.size() == 1 && !plan.front().bounded();
}

} // namespace splicer::core
