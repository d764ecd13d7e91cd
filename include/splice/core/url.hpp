// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splice/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splicer::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view username() const noexcept { return username_; }
    [[nodiscard]] std::string_view password() const noexcept { return password_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // Full URL including credentials, as handed to the transport
    [[nodiscard]] std::string full() const;
    // Same as full() with the password masked, for logs and messages
    [[nodiscard]] std::string redacted() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]

    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_ftp() const noexcept { return scheme_ == "ftp"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }
    [[nodiscard]] bool has_credentials() const noexcept { return !username_.empty(); }

    // http, https and ftp
    [[nodiscard]] bool is_supported() const noexcept { return is_http() || is_ftp(); }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    [[nodiscard]] std::string compose(bool mask_password) const;

    std::string scheme_;
    std::string username_;
    std::string password_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace splicer::core
