// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/config.hpp>
#include <webfile/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace webfile::core {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds read_timeout{READ_TIMEOUT_SEC};
};

// Status line and headers of the final (post-redirect) response
struct HttpResponse {
    long status_code{0};
    std::string effective_url;
    std::map<std::string, std::string> headers;  // Names lower-cased

    std::optional<std::uint64_t> content_length;
    std::optional<std::uint64_t> range_start;   // From Content-Range
    std::optional<std::uint64_t> range_total;   // From Content-Range, absent for "*"
    bool accepts_ranges{false};
    std::string content_type;
    std::string content_encoding;
    std::string filename;  // From Content-Disposition

    [[nodiscard]] std::string header(std::string_view name) const;

    // Fill the typed fields from status and raw headers
    [[nodiscard]] static HttpResponse from_headers(long status,
                                                   std::string effective_url,
                                                   std::map<std::string, std::string> headers);
};

// Body of an open response, read front to back
class HttpStream {
public:
    virtual ~HttpStream() = default;

    [[nodiscard]] virtual const HttpResponse& response() const noexcept = 0;

    // Up to `size` bytes into `buffer`; 0 at end of body
    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    read(std::byte* buffer, std::size_t size) noexcept = 0;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // GET, returned once the response headers have arrived. HTTP error
    // statuses are not errors here, the caller classifies them.
    [[nodiscard]] virtual std::expected<std::unique_ptr<HttpStream>, std::error_code>
    open(const HttpRequest& request) noexcept = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept = 0;
};

// libcurl transport, one multi handle per open stream so the body is pulled
// by read() instead of pushed by curl_easy_perform
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<std::unique_ptr<HttpStream>, std::error_code>
    open(const HttpRequest& request) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace webfile::core
