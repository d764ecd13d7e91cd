// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace splicer::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,    // Not started (or stopped by cancellation)
    in_flight,  // Transfer running
    paused,     // Parked at a chunk checkpoint
    complete,   // Every byte of the range landed in the sink
    failed      // Transfer or sink error
};

[[nodiscard]] std::string_view to_string(SegmentState state) noexcept;

// Byte range of one segment as produced by the planner.
// A span without end_byte is streamed to the end of the resource.
struct SegmentSpan {
    std::uint32_t index{0};
    std::uint64_t start_byte{0};
    std::optional<std::uint64_t> end_byte;  // inclusive

    [[nodiscard]] bool bounded() const noexcept { return end_byte.has_value(); }
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept {
        if (!end_byte) return std::nullopt;
        return *end_byte - start_byte + 1;
    }

    friend bool operator==(const SegmentSpan&, const SegmentSpan&) = default;
};

// Per-segment progress, copied out for display
struct SegmentProgress {
    std::uint32_t index{0};
    std::uint64_t start_byte{0};
    std::optional<std::uint64_t> end_byte;
    std::uint64_t downloaded_bytes{0};
    SegmentState state{SegmentState::pending};
};

// A single download segment (byte range).
// While a fetch runs its fetcher is the only writer; everyone else reads.
class Segment {
public:
    explicit Segment(SegmentSpan span) noexcept;

    // Non-copyable, non-movable (atomic members, fetchers hold references)
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return span_.index; }
    [[nodiscard]] std::uint64_t start_byte() const noexcept { return span_.start_byte; }
    [[nodiscard]] std::optional<std::uint64_t> end_byte() const noexcept { return span_.end_byte; }
    [[nodiscard]] const SegmentSpan& span() const noexcept { return span_; }
    [[nodiscard]] bool bounded() const noexcept { return span_.bounded(); }
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept { return span_.length(); }

    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    void state(SegmentState new_state) noexcept { state_.store(new_state, std::memory_order_release); }

    [[nodiscard]] std::uint64_t downloaded() const noexcept {
        return downloaded_.load(std::memory_order_relaxed);
    }

    // Called by the owning fetcher as chunks land
    void add_downloaded(std::uint64_t bytes) noexcept {
        downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    }

    // Back to zero before a fresh fetch of the whole range
    void reset() noexcept;

    [[nodiscard]] SegmentProgress progress() const noexcept;

private:
    SegmentSpan span_;
    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint64_t> downloaded_{0};
};

} // namespace splicer::core
