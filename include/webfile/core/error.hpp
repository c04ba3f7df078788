// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace webfile::core {

enum class StreamErrc {
    success = 0,
    connection_error,       // Network unreachable, reset, DNS failure
    timeout,                // Connect or read timeout
    client_error,           // 4xx
    server_error,           // 5xx
    range_not_satisfiable,  // 416, stale partial download
    seek_out_of_range,      // Offset outside [0, size)
    range_unsupported,      // Server does not serve byte ranges
    size_mismatch,          // Downloaded length differs from declared length
    size_unknown,           // Operation needs a size the server never reported
    tool_error,             // External remux process failed
    invalid_url,
    invalid_playlist,
    http_error,             // Any other unexpected status
};

namespace detail {

struct StreamErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "webfile::stream";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<StreamErrc>(ev)) {
            case StreamErrc::success:                return "Success";
            case StreamErrc::connection_error:       return "Connection error";
            case StreamErrc::timeout:                return "Operation timed out";
            case StreamErrc::client_error:           return "Client error (4xx)";
            case StreamErrc::server_error:           return "Server error (5xx)";
            case StreamErrc::range_not_satisfiable:  return "Range not satisfiable";
            case StreamErrc::seek_out_of_range:      return "Seek offset out of range";
            case StreamErrc::range_unsupported:      return "Server does not support range requests";
            case StreamErrc::size_mismatch:          return "Downloaded size does not match declared size";
            case StreamErrc::size_unknown:           return "Resource size is unknown";
            case StreamErrc::tool_error:             return "External tool failed";
            case StreamErrc::invalid_url:            return "Invalid URL";
            case StreamErrc::invalid_playlist:       return "Invalid playlist";
            case StreamErrc::http_error:             return "Unexpected HTTP status";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StreamErrcCategory& stream_errc_category() noexcept {
    static detail::StreamErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StreamErrc e) noexcept {
    return {static_cast<int>(e), stream_errc_category()};
}

// Transient failures worth another attempt
[[nodiscard]] inline bool is_retryable(const std::error_code& ec) noexcept {
    return ec == make_error_code(StreamErrc::connection_error)
        || ec == make_error_code(StreamErrc::timeout)
        || ec == make_error_code(StreamErrc::server_error);
}

// 4xx class, 416 included
[[nodiscard]] inline bool is_client_error(const std::error_code& ec) noexcept {
    return ec == make_error_code(StreamErrc::client_error)
        || ec == make_error_code(StreamErrc::range_not_satisfiable);
}

[[nodiscard]] inline bool is_seek_error(const std::error_code& ec) noexcept {
    return ec == make_error_code(StreamErrc::seek_out_of_range)
        || ec == make_error_code(StreamErrc::range_unsupported);
}

// Maps an HTTP status to an error, success for 1xx-3xx
[[nodiscard]] inline std::error_code status_error(long status) noexcept {
    if (status == 416) return make_error_code(StreamErrc::range_not_satisfiable);
    if (status >= 400 && status < 500) return make_error_code(StreamErrc::client_error);
    if (status >= 500 && status < 600) return make_error_code(StreamErrc::server_error);
    if (status >= 600 || status <= 0) return make_error_code(StreamErrc::http_error);
    return {};
}

} // namespace webfile::core

namespace std {

template<>
struct is_error_code_enum<webfile::core::StreamErrc> : true_type {};

} // namespace std
