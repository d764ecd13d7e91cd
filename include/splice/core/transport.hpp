// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/error.hpp>
#include <splice/core/url.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace splicer::core {

// What a probe learns about a remote resource
struct ProbeResult {
    std::optional<std::uint64_t> total_size;
    bool supports_range{false};
    std::int32_t status_code{0};
    std::string content_type;
};

// Inclusive byte range, sent as "Range: bytes=<first>-<last>"
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return last - first + 1; }
    [[nodiscard]] std::string spec() const;          // "<first>-<last>"
    [[nodiscard]] std::string header_value() const;  // "bytes=<first>-<last>"
};

// Receives body bytes in arrival order; return false to stop the transfer
using DataHandler = std::function<bool(std::span<const std::byte>)>;

// Polled while a transfer or probe waits on the network; true aborts it
using AbortCheck = std::function<bool()>;

// Network access used by the engine. Implementations must be safe to call
// from several threads at once (one call per fetcher thread).
class Transport {
public:
    virtual ~Transport() = default;

    // Size and range capability of the resource behind url
    [[nodiscard]] virtual std::expected<ProbeResult, std::error_code>
    probe(const Url& url, const AbortCheck& abort) noexcept = 0;

    // Stream the resource (or only range) into on_data.
    // Returns DownloadErrc::cancelled when on_data or abort stopped it.
    [[nodiscard]] virtual std::error_code
    fetch(const Url& url,
          const std::optional<ByteRange>& range,
          const DataHandler& on_data,
          const AbortCheck& abort) noexcept = 0;
};

} // namespace splicer::core
