// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <webfile/core/error.hpp>
#include <webfile/core/http_session.hpp>

using namespace webfile::core;

TEST_CASE("HttpResponse::from_headers", "[http]") {
    SECTION("Plain response") {
        auto response = HttpResponse::from_headers(200, "https://example.com/a.mp4", {
            {"content-length", "1024"},
            {"content-type", "video/mp4"},
            {"accept-ranges", "bytes"},
        });
        CHECK(response.content_length == 1024u);
        CHECK(response.content_type == "video/mp4");
        CHECK(response.accepts_ranges);
        CHECK_FALSE(response.range_start.has_value());
        CHECK_FALSE(response.range_total.has_value());
        CHECK(response.header("Content-Type") == "video/mp4");
        CHECK(response.header("x-missing").empty());
    }

    SECTION("Partial content") {
        auto response = HttpResponse::from_headers(206, "https://example.com/a.mp4", {
            {"content-length", "512"},
            {"content-range", "bytes 512-1023/1024"},
        });
        CHECK(response.accepts_ranges);
        CHECK(response.range_start == 512u);
        CHECK(response.range_total == 1024u);
    }

    SECTION("Unsatisfiable range") {
        auto response = HttpResponse::from_headers(416, "https://example.com/a.mp4", {
            {"content-range", "bytes */1024"},
        });
        CHECK_FALSE(response.range_start.has_value());
        CHECK(response.range_total == 1024u);
    }

    SECTION("Unknown total") {
        auto response = HttpResponse::from_headers(206, "https://example.com/live", {
            {"content-range", "bytes 0-99/*"},
        });
        CHECK(response.range_start == 0u);
        CHECK_FALSE(response.range_total.has_value());
    }

    SECTION("No range support") {
        auto response = HttpResponse::from_headers(200, "https://example.com/a", {
            {"accept-ranges", "none"},
        });
        CHECK_FALSE(response.accepts_ranges);
        CHECK_FALSE(response.content_length.has_value());
    }

    SECTION("Encoding and disposition") {
        auto response = HttpResponse::from_headers(200, "https://example.com/a", {
            {"content-encoding", "GZIP"},
            {"content-disposition", "attachment; filename=\"a b.txt\""},
        });
        CHECK(response.content_encoding == "gzip");
        CHECK(response.filename == "a b.txt");
    }
}

TEST_CASE("status_error", "[http]") {
    CHECK_FALSE(status_error(200));
    CHECK_FALSE(status_error(206));
    CHECK_FALSE(status_error(304));
    CHECK(status_error(404) == make_error_code(StreamErrc::client_error));
    CHECK(status_error(416) == make_error_code(StreamErrc::range_not_satisfiable));
    CHECK(status_error(503) == make_error_code(StreamErrc::server_error));

    CHECK(is_client_error(status_error(403)));
    CHECK(is_client_error(status_error(416)));
    CHECK(is_retryable(status_error(500)));
    CHECK_FALSE(is_retryable(status_error(404)));
    CHECK(is_seek_error(make_error_code(StreamErrc::range_unsupported)));
}
