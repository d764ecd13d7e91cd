// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/core/curl_transport.hpp>
#include <splice/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string>

namespace splicer::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::once_flag g_init_once;

void ensure_global_init() noexcept {
    std::call_once(g_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    const std::size_t total = size * nitems;
    auto* headers = static_cast<detail::HeaderMap*>(userdata);
    if (headers) {
        detail::parse_header_line(std::string_view(buffer, total), *headers);
    }
    return total;
}

// Probe GET: stop as soon as the body starts
struct ProbeBody {
    bool body_seen{false};
};

std::size_t probe_body_callback(char*, std::size_t size, std::size_t nitems, void* userdata) {
    auto* pb = static_cast<ProbeBody*>(userdata);
    if (size * nitems > 0) pb->body_seen = true;
    return 0;
}

struct FetchContext {
    CURL* curl{nullptr};
    const DataHandler* on_data{nullptr};
    bool check_partial{false};
    bool status_checked{false};
    bool stopped_by_handler{false};
    std::error_code failure;
};

std::size_t fetch_write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    const std::size_t total = size * nitems;

    if (ctx->check_partial && !ctx->status_checked) {
        ctx->status_checked = true;
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        if (code != 206) {
            ctx->failure = make_error_code(DownloadErrc::range_not_honored);
            return 0;
        }
    }

    const auto* data = reinterpret_cast<const std::byte*>(ptr);
    if (!(*ctx->on_data)(std::span<const std::byte>(data, total))) {
        ctx->stopped_by_handler = true;
        return 0;
    }
    return total;
}

int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* abort = static_cast<const AbortCheck*>(userdata);
    return (abort && *abort && (*abort)()) ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url, std::uint32_t connect_timeout,
                          const std::string& user_agent, const AbortCheck& abort) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, FOLLOW_REDIRECTS ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<AbortCheck*>(&abort));
}

} // namespace

//=============================================================================
// detail helpers
//=============================================================================

namespace detail {

void parse_header_line(std::string_view line, HeaderMap& headers) {
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    auto name = trim(line.substr(0, colon));
    if (name.empty()) return;

    headers[to_lower(name)] = std::string(trim(line.substr(colon + 1)));
}

std::optional<std::uint64_t> parse_content_length(const HeaderMap& headers) noexcept {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) return std::nullopt;

    const std::string& value = it->second;
    std::uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
    return length;
}

bool parse_accepts_ranges(const HeaderMap& headers) noexcept {
    auto it = headers.find("accept-ranges");
    if (it == headers.end()) return false;

    // Comma-separated tokens; "none" or anything else means no ranges
    std::string_view rest = it->second;
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto token = trim(rest.substr(0, comma));
        if (token.size() == 5) {
            bool match = true;
            for (std::size_t i = 0; i < 5; ++i) {
                if (std::tolower(static_cast<unsigned char>(token[i])) != "bytes"[i]) {
                    match = false;
                    break;
                }
            }
            if (match) return true;
        }
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return false;
}

std::error_code map_http_status(long status) noexcept {
    if (status < 400) return {};
    if (status == 404 || status == 410) return make_error_code(DownloadErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status == 416) return make_error_code(DownloadErrc::invalid_range);
    if (status == 408) return make_error_code(DownloadErrc::timeout);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::protocol_error);
}

std::error_code map_curl_code(int code) noexcept {
    switch (static_cast<CURLcode>(code)) {
        case CURLE_OK:
            return {};
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::unsupported_scheme);
        case CURLE_URL_MALFORMAT:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            return make_error_code(DownloadErrc::permission_denied);
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return make_error_code(DownloadErrc::not_found);
        case CURLE_RANGE_ERROR:
        case CURLE_BAD_DOWNLOAD_RESUME:
            return make_error_code(DownloadErrc::invalid_range);
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_HTTP2:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_WEIRD_227_FORMAT:
            return make_error_code(DownloadErrc::protocol_error);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace detail

//=============================================================================
// CurlTransport
//=============================================================================

struct CurlTransport::HeadResponse {
    long status{0};
    detail::HeaderMap headers;
};

CurlTransport::CurlTransport(const DownloadConfig& config)
    : connect_timeout_sec_(config.connect_timeout_sec)
    , stall_timeout_sec_(config.stall_timeout_sec)
    , user_agent_(config.user_agent) {
    ensure_global_init();
}

std::expected<ProbeResult, std::error_code>
CurlTransport::probe(const Url& url, const AbortCheck& abort) noexcept {
    if (!url.is_supported()) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_scheme));
    }
    return url.is_ftp() ? probe_ftp(url, abort) : probe_http(url, abort);
}

std::expected<CurlTransport::HeadResponse, std::error_code>
CurlTransport::request_headers(const Url& url, bool use_head, const AbortCheck& abort) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HeadResponse response;
    ProbeBody body;
    const std::string target = url.full();

    apply_common_options(curl.ptr, target, connect_timeout_sec_, user_agent_, abort);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_timeout_sec_));
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    if (use_head) {
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, probe_body_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);
    }

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result == CURLE_WRITE_ERROR && body.body_seen) {
        result = CURLE_OK;
    }
    if (result != CURLE_OK) {
        return std::unexpected(detail::map_curl_code(result));
    }

    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<ProbeResult, std::error_code>
CurlTransport::probe_http(const Url& url, const AbortCheck& abort) noexcept {
    auto head = request_headers(url, true, abort);
    if (head && (head->status == 405 || head->status == 501)) {
        log()->debug("HEAD not allowed for {}, probing with GET", url.redacted());
        head = request_headers(url, false, abort);
    }
    if (!head) {
        return std::unexpected(head.error());
    }
    if (auto ec = detail::map_http_status(head->status)) {
        return std::unexpected(ec);
    }

    ProbeResult result;
    result.status_code = static_cast<std::int32_t>(head->status);
    result.total_size = detail::parse_content_length(head->headers);
    result.supports_range = detail::parse_accepts_ranges(head->headers);
    if (auto it = head->headers.find("content-type"); it != head->headers.end()) {
        result.content_type = it->second;
    }

    // A compressed body length says nothing about the range space
    if (auto it = head->headers.find("content-encoding");
        it != head->headers.end() && !it->second.empty() && it->second != "identity") {
        result.supports_range = false;
    }

    log()->debug("probe {}: status={} size={} ranges={}", url.redacted(), result.status_code,
                 result.total_size ? std::to_string(*result.total_size) : "unknown",
                 result.supports_range);
    return result;
}

std::expected<ProbeResult, std::error_code>
CurlTransport::probe_ftp(const Url& url, const AbortCheck& abort) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    const std::string target = url.full();
    apply_common_options(curl.ptr, target, connect_timeout_sec_, user_agent_, abort);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(detail::map_curl_code(result));
    }

    ProbeResult probe;
    curl_off_t size = -1;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &size) == CURLE_OK && size >= 0) {
        probe.total_size = static_cast<std::uint64_t>(size);
    }
    // FTP transfers go through one stream
    probe.supports_range = false;

    log()->debug("probe {}: size={}", url.redacted(),
                 probe.total_size ? std::to_string(*probe.total_size) : "unknown");
    return probe;
}

std::error_code
CurlTransport::fetch(const Url& url,
                     const std::optional<ByteRange>& range,
                     const DataHandler& on_data,
                     const AbortCheck& abort) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    const std::string target = url.full();
    apply_common_options(curl.ptr, target, connect_timeout_sec_, user_agent_, abort);

    std::string range_spec;
    if (range) {
        range_spec = range->spec();
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_spec.c_str());
    }

    if (url.is_http()) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_timeout_sec_));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(CHUNK_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    FetchContext ctx;
    ctx.curl = curl.ptr;
    ctx.on_data = &on_data;
    ctx.check_partial = range.has_value() && url.is_http();

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, fetch_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    const CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.failure) {
        return ctx.failure;
    }
    if (result == CURLE_WRITE_ERROR && ctx.stopped_by_handler) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
        return detail::map_http_status(status);
    }
    if (result != CURLE_OK) {
        log()->debug("fetch {} [{}] failed: {}", url.redacted(),
                     range ? range_spec : std::string("full"), curl_easy_strerror(result));
        return detail::map_curl_code(result);
    }

    // An empty ranged body never reached the status check
    if (ctx.check_partial && !ctx.status_checked && range->length() > 0) {
        long status = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
        if (status != 206) {
            return make_error_code(DownloadErrc::range_not_honored);
        }
    }
    return {};
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlTransport::global_init() noexcept {
    ensure_global_init();
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace splicer::core
