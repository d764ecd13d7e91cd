// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace splicer::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    unsupported_scheme,
    invalid_segment_count,
    invalid_range,
    range_not_honored,
    short_transfer,
    connection_lost,
    too_many_redirects,
    protocol_error,
    cancelled,
    invalid_transition,
    invalid_config,
    unknown_job,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splicer::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::network_error:         return "Network error";
            case DownloadErrc::timeout:               return "Operation timed out";
            case DownloadErrc::refused:               return "Connection refused";
            case DownloadErrc::dns_error:             return "DNS resolution failed";
            case DownloadErrc::ssl_error:             return "SSL/TLS error";
            case DownloadErrc::not_found:             return "Resource not found";
            case DownloadErrc::server_error:          return "Server error (5xx)";
            case DownloadErrc::permission_denied:     return "Permission denied";
            case DownloadErrc::invalid_url:           return "Invalid URL";
            case DownloadErrc::unsupported_scheme:    return "Unsupported URL scheme";
            case DownloadErrc::invalid_segment_count: return "Segment count must be between 1 and 16";
            case DownloadErrc::invalid_range:         return "Invalid byte range";
            case DownloadErrc::range_not_honored:     return "Server ignored the byte range";
            case DownloadErrc::short_transfer:        return "Transfer ended before the range was complete";
            case DownloadErrc::connection_lost:       return "Connection lost";
            case DownloadErrc::too_many_redirects:    return "Too many redirects";
            case DownloadErrc::protocol_error:        return "Protocol error";
            case DownloadErrc::cancelled:             return "Download cancelled";
            case DownloadErrc::invalid_transition:    return "Command not valid in the current state";
            case DownloadErrc::invalid_config:        return "Invalid configuration";
            case DownloadErrc::unknown_job:           return "Unknown download id";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Stage at which a job failed
enum class FailureKind : std::uint8_t {
    none,
    probe,
    fetch,
    io
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

// Local disk faults are not retried: fetching the bytes again cannot fix them
[[nodiscard]] bool is_retryable(const std::error_code& ec) noexcept;

} // namespace splicer::core

namespace std {

template<>
struct is_error_code_enum<splicer::core::DownloadErrc> : true_type {};

} // namespace std
