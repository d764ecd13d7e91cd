// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/segment.hpp>
#include <splice/core/transfer_control.hpp>
#include <splice/core/transport.hpp>
#include <splice/disk/file.hpp>
#include <cstdint>
#include <functional>

namespace splicer::core {

enum class SegmentOutcome : std::uint8_t {
    complete,
    cancelled,
    failed
};

struct SegmentResult {
    std::uint32_t index{0};
    SegmentOutcome outcome{SegmentOutcome::failed};
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return outcome == SegmentOutcome::complete; }
};

// Invoked after every chunk with the segment's running byte count
using ChunkObserver = std::function<void(std::uint64_t segment_bytes)>;

// Streams one segment's range into its sink in CHUNK_SIZE pieces,
// checking the pause and cancel flags between pieces.
class SegmentFetcher {
public:
    SegmentFetcher(Transport& transport, TransferControl& control) noexcept
        : transport_(transport), control_(control) {}

    void chunk_observer(ChunkObserver observer) { observer_ = std::move(observer); }

    // Always starts the range from its first byte; previous bytes are discarded
    [[nodiscard]] SegmentResult fetch(Segment& segment, const Url& url, disk::File& sink) noexcept;

private:
    // false: stop the transfer (cancelled)
    [[nodiscard]] bool checkpoint(Segment& segment) noexcept;

    Transport& transport_;
    TransferControl& control_;
    ChunkObserver observer_;
};

} // namespace splicer::core
