// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <webfile/core/caching_resource.hpp>
#include <webfile/core/remote_resource.hpp>
#include <webfile/disk/fragment_store.hpp>
#include "fake_transport.hpp"

using namespace webfile;
using namespace webfile::core;
using disk::PartialDownloadStore;
using test::FakeResource;
using test::FakeTransport;

namespace {

constexpr const char* URL = "https://example.com/range/1024";

struct Fixture {
    std::string content = test::make_body(1024);
    test::TempDir dir;
    std::filesystem::path target = dir / "test.txt";
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

    explicit Fixture(FakeResource resource = {}) {
        if (resource.body.empty()) resource.body = content;
        transport->serve(URL, std::move(resource));
    }

    CachingResource make(std::size_t chunk_size = 256) {
        return CachingResource(std::make_unique<RemoteResource>(URL, transport, test::fast_options()),
                               std::make_unique<PartialDownloadStore>(target),
                               chunk_size);
    }

    void precache(std::uint64_t offset, std::string_view data) {
        PartialDownloadStore store(target);
        REQUIRE_FALSE(store.write(offset, to_bytes(data)));
    }
};

} // namespace

TEST_CASE("CachingResource::read - same bytes as the remote", "[cache]") {
    Fixture f;
    auto cached = f.make();

    REQUIRE_FALSE(cached.seek(0));
    CHECK(to_string(cached.read(128).value()) == f.content.substr(0, 128));

    REQUIRE_FALSE(cached.seek(512));
    CHECK(to_string(cached.read(128).value()) == f.content.substr(512, 128));

    REQUIRE_FALSE(cached.seek(576));
    CHECK(to_string(cached.read(128).value()) == f.content.substr(576, 128));

    REQUIRE_FALSE(cached.seek(256));
    CHECK(to_string(cached.read().value()) == f.content.substr(256));
    CHECK(cached.tell() == 1024);
    CHECK_FALSE(cached.cache().joined());

    SECTION("Filling the last hole joins the final file") {
        REQUIRE_FALSE(cached.seek(128));
        CHECK(to_string(cached.read(128).value()) == f.content.substr(128, 128));
        CHECK(cached.cache().joined());
        CHECK(test::slurp(f.target) == f.content);

        PartialDownloadStore store(f.target);
        CHECK(store.fragments().value().empty());
    }

    SECTION("Cached ranges are served locally") {
        f.transport->clear_requests();
        REQUIRE_FALSE(cached.seek(600));
        CHECK(to_string(cached.read(50).value()) == f.content.substr(600, 50));
        CHECK(f.transport->requests().empty());
    }
}

TEST_CASE("CachingResource - resume fetches only the missing bytes", "[cache]") {
    Fixture f;
    f.precache(0, f.content.substr(0, 512));

    auto cached = f.make();
    auto path = cached.download();
    REQUIRE(path.has_value());
    CHECK(*path == f.target);
    CHECK(test::slurp(f.target) == f.content);

    const auto& requests = f.transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].range == "bytes=512-");

    PartialDownloadStore store(f.target);
    CHECK(store.fragments().value().empty());
    CHECK_FALSE(std::filesystem::exists(f.dir / "test.txt.part0"));
    CHECK_FALSE(std::filesystem::exists(f.dir / "test.txt.part512"));

    SECTION("Second run makes no requests") {
        f.transport->clear_requests();
        auto again = f.make();
        CHECK(to_string(again.read().value()) == f.content);

        auto repeated = again.download();
        REQUIRE(repeated.has_value());
        CHECK(*repeated == f.target);
        CHECK(f.transport->requests().empty());
    }
}

TEST_CASE("CachingResource::read - resume through reads", "[cache]") {
    Fixture f;
    f.precache(0, f.content.substr(0, 512));

    auto cached = f.make();
    auto data = cached.read();
    REQUIRE(data.has_value());
    CHECK(to_string(*data) == f.content);

    const auto& requests = f.transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].range == "bytes=512-");
    CHECK(cached.cache().joined());
}

TEST_CASE("CachingResource::read - fragments covering the whole resource", "[cache]") {
    Fixture f;

    SECTION("Known size joins without touching the remote") {
        auto cached = f.make();
        REQUIRE(cached.read(100).has_value());
        f.precache(100, f.content.substr(100));
        f.transport->clear_requests();

        auto data = cached.read();
        REQUIRE(data.has_value());
        CHECK(to_string(*data) == f.content.substr(100));
        CHECK(f.transport->requests().empty());
        CHECK(cached.cache().joined());
        CHECK(test::slurp(f.target) == f.content);
    }

    SECTION("Fragments left by an earlier run are joined") {
        f.precache(0, f.content);
        auto cached = f.make();

        auto data = cached.read();
        REQUIRE(data.has_value());
        CHECK(to_string(*data) == f.content);
        CHECK(cached.cache().joined());
        CHECK(test::slurp(f.target) == f.content);

        PartialDownloadStore store(f.target);
        CHECK(store.fragments().value().empty());

        const auto& requests = f.transport->requests();
        REQUIRE_FALSE(requests.empty());
        CHECK(requests[0].range == "bytes=1024-");
    }
}

TEST_CASE("CachingResource - server without range support", "[cache]") {
    FakeResource plain;
    plain.ranges = false;
    Fixture f(plain);
    f.precache(0, f.content.substr(0, 512));

    auto cached = f.make();

    SECTION("Only the cached prefix comes back") {
        auto data = cached.read();
        REQUIRE(data.has_value());
        CHECK(to_string(*data) == f.content.substr(0, 512));
        CHECK(cached.tell() == 512);
        CHECK_FALSE(cached.cache().joined());
    }

    SECTION("Requests inside the prefix never touch the network") {
        CHECK(to_string(cached.read(100).value()) == f.content.substr(0, 100));
        CHECK(f.transport->requests().empty());
    }
}

TEST_CASE("CachingResource::download", "[cache][download]") {
    SECTION("Fresh download") {
        Fixture f;
        auto cached = f.make();

        std::uint64_t last = 0;
        auto path = cached.download([&last](const TransferProgress& p) { last = p.downloaded_bytes; });
        REQUIRE(path.has_value());
        CHECK(*path == f.target);
        CHECK(test::slurp(f.target) == f.content);
        CHECK(last == 1024);
        CHECK(f.transport->count("GET") == 1);
    }

    SECTION("Unknown size is joined at end of stream") {
        FakeResource unsized;
        unsized.send_length = false;
        Fixture f(unsized);
        auto cached = f.make();

        auto path = cached.download();
        REQUIRE(path.has_value());
        CHECK(test::slurp(f.target) == f.content);
    }

    SECTION("Short body is a size mismatch") {
        FakeResource short_body;
        short_body.send_length = false;
        short_body.headers["content-length"] = "2048";
        Fixture f(short_body);
        auto cached = f.make();

        auto path = cached.download();
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error() == make_error_code(StreamErrc::size_mismatch));
        CHECK_FALSE(cached.cache().joined());
    }

    SECTION("Unlink removes fragments and final file") {
        Fixture f;
        auto cached = f.make();
        REQUIRE(cached.read(100).has_value());
        REQUIRE_FALSE(cached.unlink());
        CHECK_FALSE(std::filesystem::exists(f.dir / "test.txt.part0"));

        REQUIRE(cached.download().has_value());
        REQUIRE_FALSE(cached.unlink());
        CHECK_FALSE(std::filesystem::exists(f.target));
    }
}

TEST_CASE("CachingResource - errors", "[cache]") {
    Fixture f;
    auto cached = f.make();

    SECTION("Negative seek") {
        CHECK(cached.seek(-5) == make_error_code(StreamErrc::seek_out_of_range));
    }

    SECTION("Failed fetch keeps the position") {
        f.transport->fail_connections(true);
        REQUIRE_FALSE(cached.seek(10));
        auto data = cached.read(10);
        REQUIRE_FALSE(data.has_value());
        CHECK(data.error() == make_error_code(StreamErrc::connection_error));
        CHECK(cached.tell() == 10);
    }

    SECTION("Reading past the end is empty") {
        REQUIRE(cached.read().has_value());
        REQUIRE_FALSE(cached.seek(4096));
        CHECK(cached.read().value().empty());
    }
}
