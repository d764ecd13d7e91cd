// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/config.hpp>
#include <splice/core/segment.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace splicer::core {

// Partition a resource into contiguous, non-overlapping segment spans.
//
// Returns exactly one unbounded span starting at byte 0 when the size is
// unknown, the size is at or below the threshold, or ranges are not
// supported. Otherwise splits [0, total_size - 1] into requested_count
// spans of floor(total_size / requested_count) bytes; the last span takes
// the remainder. requested_count is clamped to [MIN_SEGMENTS, MAX_SEGMENTS].
[[nodiscard]] std::vector<SegmentSpan>
plan_segments(std::optional<std::uint64_t> total_size,
              bool supports_range,
              std::uint32_t requested_count,
              std::uint64_t threshold = SINGLE_SEGMENT_THRESHOLD);

// True when a plan is the single streamed whole-resource span
[[nodiscard]] bool is_single_stream(const std::vector<SegmentSpan>& plan) noexcept;

} // namespace splicer::core
