// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace webfile::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path component, "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    // Resolve a reference (absolute, scheme-relative, host-relative or
    // path-relative) against this URL
    [[nodiscard]] std::string resolve(std::string_view reference) const;

    // resolve() for a base given as text; an unparsable base yields the reference unchanged
    [[nodiscard]] static std::string resolve(std::string_view base, std::string_view reference);

    Url() = default;

    friend bool operator==(const Url& a, const Url& b) { return a.full() == b.full(); }

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace webfile::core
