// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/config.hpp>
#include <splice/core/transport.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace splicer::core {

// libcurl-backed transport for http, https and ftp
class CurlTransport final : public Transport {
public:
    explicit CurlTransport(const DownloadConfig& config = {});
    ~CurlTransport() override = default;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const Url& url, const AbortCheck& abort) noexcept override;

    [[nodiscard]] std::error_code
    fetch(const Url& url,
          const std::optional<ByteRange>& range,
          const DataHandler& on_data,
          const AbortCheck& abort) noexcept override;

    // Global initialization (once per process, before threads start)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    struct HeadResponse;

    [[nodiscard]] std::expected<HeadResponse, std::error_code>
    request_headers(const Url& url, bool use_head, const AbortCheck& abort) noexcept;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe_http(const Url& url, const AbortCheck& abort) noexcept;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe_ftp(const Url& url, const AbortCheck& abort) noexcept;

    std::uint32_t connect_timeout_sec_;
    std::uint32_t stall_timeout_sec_;
    std::string user_agent_;
};

namespace detail {

// Lower-cased header name -> value of the final response
using HeaderMap = std::map<std::string, std::string>;

// Feed one raw header line. A status line ("HTTP/...") starts a new
// response, so headers of redirect hops are dropped.
void parse_header_line(std::string_view line, HeaderMap& headers);

[[nodiscard]] std::optional<std::uint64_t> parse_content_length(const HeaderMap& headers) noexcept;

// True only for an explicit "Accept-Ranges: bytes"
[[nodiscard]] bool parse_accepts_ranges(const HeaderMap& headers) noexcept;

// Empty for success codes
[[nodiscard]] std::error_code map_http_status(long status) noexcept;

// Takes a CURLcode
[[nodiscard]] std::error_code map_curl_code(int code) noexcept;

} // namespace detail

} // namespace splicer::core
