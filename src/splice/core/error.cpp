// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/error.hpp>
#include <splice/disk/error.hpp>

namespace splicer::core {

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::none:  return "none";
        case FailureKind::probe: return "probe";
        case FailureKind::fetch: return "fetch";
        case FailureKind::io:    return "io";
    }
    return "unknown";
}

bool is_retryable(const std::error_code& ec) noexcept {
    if (!ec) return false;
    if (ec.category() == disk::disk_errc_category()) return false;
    if (ec == DownloadErrc::cancelled) return false;
    return true;
}

} // namespace splicer::core
