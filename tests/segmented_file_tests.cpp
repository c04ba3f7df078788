// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <webfile/media/remuxer.hpp>
#include <webfile/media/segmented_file.hpp>
#include "fake_transport.hpp"
#include <algorithm>

using namespace webfile;
using namespace webfile::media;
using core::StreamErrc;
using test::FakeResource;
using test::FakeTransport;

namespace {

constexpr const char* MASTER_URL = "https://example.com/hls/master.m3u8";
constexpr const char* MEDIA_URL = "https://example.com/hls/high/index.m3u8";

constexpr const char* MASTER =
    "#EXTM3U\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=100000,RESOLUTION=320x180\n"
    "low/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=500000,RESOLUTION=1280x720\n"
    "high/index.m3u8\n";

constexpr const char* MEDIA =
    "#EXTM3U\n"
    "#EXT-X-TARGETDURATION:8\n"
    "#EXTINF:8.0,\n"
    "seg0.ts\n"
    "#EXTINF:8.0,\n"
    "seg1.ts\n"
    "#EXTINF:4.0,\n"
    "seg2.ts\n"
    "#EXT-X-ENDLIST\n";

struct Server {
    std::string seg0 = test::make_body(100, 'a');
    std::string seg1 = test::make_body(100, 'A');
    std::string seg2 = test::make_body(50, '0');
    std::string content = seg0 + seg1 + seg2;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

    Server() {
        transport->serve(MASTER_URL, FakeResource{MASTER});
        transport->serve(MEDIA_URL, FakeResource{MEDIA});
        transport->serve("https://example.com/hls/low/index.m3u8", FakeResource{"#EXTM3U\n#EXTINF:1,\nlow.ts\n"});
        transport->serve("https://example.com/hls/high/seg0.ts", FakeResource{seg0});
        transport->serve("https://example.com/hls/high/seg1.ts", FakeResource{seg1});
        transport->serve("https://example.com/hls/high/seg2.ts", FakeResource{seg2});
    }

    [[nodiscard]] bool requested(const std::string& url) const {
        const auto& requests = transport->requests();
        return std::any_of(requests.begin(), requests.end(),
                           [&url](const test::RecordedRequest& r) { return r.url == url; });
    }
};

// Records the local playlist it was handed and writes a placeholder container
class FakeRemuxer final : public Remuxer {
public:
    explicit FakeRemuxer(bool fail = false) : fail_(fail) {}

    std::error_code remux(const std::filesystem::path& manifest,
                          const std::filesystem::path& output,
                          const std::map<std::string, std::string>& headers) noexcept override {
        manifest_text = test::slurp(manifest);
        segment_files.clear();
        std::error_code listing_error;
        for (const auto& entry : std::filesystem::directory_iterator(manifest.parent_path(), listing_error)) {
            segment_files.push_back(entry.path().filename().string());
        }
        std::sort(segment_files.begin(), segment_files.end());
        received_headers = headers;
        output_path = output;
        if (fail_) {
            return make_error_code(StreamErrc::tool_error);
        }
        test::spill(output, "remuxed");
        return {};
    }

    std::string manifest_text;
    std::vector<std::string> segment_files;
    std::map<std::string, std::string> received_headers;
    std::filesystem::path output_path;

private:
    bool fail_;
};

} // namespace

TEST_CASE("SegmentedRemoteFile::read", "[segmented]") {
    Server server;
    SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());

    SECTION("Read across segment boundaries") {
        REQUIRE_FALSE(file.seek(90));
        auto data = file.read(128);
        REQUIRE(data.has_value());
        CHECK(core::to_string(*data) == server.content.substr(90, 128));
        CHECK(file.tell() == 218);
    }

    SECTION("Read everything") {
        CHECK(core::to_string(file.read().value()) == server.content);
        CHECK(file.tell() == 250);
        CHECK(file.read().value().empty());
    }

    SECTION("Read from each offset") {
        REQUIRE_FALSE(file.seek(0));
        CHECK(core::to_string(file.read(128).value()) == server.content.substr(0, 128));

        REQUIRE_FALSE(file.seek(200));
        CHECK(core::to_string(file.read().value()) == server.content.substr(200));

        REQUIRE_FALSE(file.seek(128));
        REQUIRE_FALSE(file.seek(0));
        CHECK(core::to_string(file.read(128).value()) == server.content.substr(0, 128));
    }

    SECTION("Past the end") {
        REQUIRE_FALSE(file.seek(1000));
        CHECK(file.read().value().empty());
    }

    SECTION("Negative seek") {
        CHECK(file.seek(-1) == make_error_code(StreamErrc::seek_out_of_range));
    }

    SECTION("Size is the sum of the segments") {
        CHECK(file.size().value() == 250u);
    }
}

TEST_CASE("SegmentedRemoteFile::read - broken segment", "[segmented]") {
    Server server;
    auto& seg0 = server.transport->resource("https://example.com/hls/high/seg0.ts");

    SECTION("Body drops and the server cannot resume") {
        seg0.drop_at = 50;
        seg0.ranges = false;
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());

        auto data = file.read(150);
        REQUIRE_FALSE(data.has_value());
        CHECK(data.error() == make_error_code(StreamErrc::range_unsupported));
        CHECK(file.tell() == 0);
        CHECK_FALSE(server.requested("https://example.com/hls/high/seg1.ts"));
    }

    SECTION("Body ends before its Content-Length") {
        seg0.body = seg0.body.substr(0, 50);
        seg0.send_length = false;
        seg0.headers["content-length"] = "100";
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());

        auto data = file.read(150);
        REQUIRE_FALSE(data.has_value());
        CHECK(data.error() == make_error_code(StreamErrc::size_mismatch));
        CHECK(file.tell() == 0);

        REQUIRE_FALSE(file.seek(0));
        CHECK_FALSE(file.read().has_value());
    }
}

TEST_CASE("SegmentedRemoteFile - playlist resolution", "[segmented]") {
    Server server;
    SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());

    SECTION("Highest bandwidth variant is followed") {
        auto playlist = file.playlist();
        REQUIRE(playlist.has_value());
        REQUIRE((*playlist)->segments.size() == 3);
        CHECK((*playlist)->segments[0].url == "https://example.com/hls/high/seg0.ts");
        CHECK(server.requested(MEDIA_URL));
        CHECK_FALSE(server.requested("https://example.com/hls/low/index.m3u8"));
    }

    SECTION("Manifest has absolute URIs") {
        auto manifest = file.manifest();
        REQUIRE(manifest.has_value());
        CHECK(*manifest ==
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:8\n"
            "#EXTINF:8.0,\n"
            "https://example.com/hls/high/seg0.ts\n"
            "#EXTINF:8.0,\n"
            "https://example.com/hls/high/seg1.ts\n"
            "#EXTINF:4.0,\n"
            "https://example.com/hls/high/seg2.ts\n"
            "#EXT-X-ENDLIST\n");
    }

    SECTION("Segments are built once") {
        auto first = file.segment(1);
        auto again = file.segment(1);
        REQUIRE(first.has_value());
        CHECK(*first == *again);
        CHECK((*first)->request_url() == "https://example.com/hls/high/seg1.ts");
        CHECK_FALSE(file.segment(3).has_value());
    }

    SECTION("Media playlists are used directly") {
        SegmentedRemoteFile direct(MEDIA_URL, server.transport, test::fast_options());
        CHECK(core::to_string(direct.read().value()) == server.content);
    }

    SECTION("Changing the URL starts over") {
        REQUIRE(file.read(10).has_value());
        file.set_url("https://example.com/hls/low/index.m3u8");
        CHECK(file.tell() == 0);
        auto playlist = file.playlist();
        REQUIRE(playlist.has_value());
        CHECK((*playlist)->segments.at(0).url == "https://example.com/hls/low/low.ts");
    }

    SECTION("Not a playlist") {
        server.transport->serve("https://example.com/page.m3u8", FakeResource{"<html></html>"});
        SegmentedRemoteFile page("https://example.com/page.m3u8", server.transport, test::fast_options());
        auto data = page.read();
        REQUIRE_FALSE(data.has_value());
        CHECK(data.error() == make_error_code(StreamErrc::invalid_playlist));
    }
}

TEST_CASE("SegmentedRemoteFile::exists", "[segmented]") {
    Server server;

    SECTION("Present") {
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());
        CHECK(file.exists().value());
    }

    SECTION("Missing playlist") {
        SegmentedRemoteFile file("https://example.com/hls/gone.m3u8", server.transport, test::fast_options());
        CHECK_FALSE(file.exists().value());
    }

    SECTION("Missing first segment") {
        server.transport->serve("https://example.com/hls/broken.m3u8",
                                FakeResource{"#EXTM3U\n#EXTINF:4,\nnowhere.ts\n#EXT-X-ENDLIST\n"});
        SegmentedRemoteFile file("https://example.com/hls/broken.m3u8", server.transport, test::fast_options());
        CHECK_FALSE(file.exists().value());
    }
}

TEST_CASE("SegmentedRemoteFile - output naming", "[segmented]") {
    Server server;
    SegmentedRemoteFile file(MASTER_URL, server.transport);

    CHECK(file.default_filename() == "master.mp4");
    CHECK(file.filepath() == std::filesystem::path(".") / "master.mp4");
    CHECK(file.temp_directory() == std::filesystem::path(".") / "master");

    file.naming().directory("videos");
    file.naming().filestem("episode 1");
    CHECK(file.filepath() == std::filesystem::path("videos") / "episode_1.mp4");
    CHECK(file.temp_directory() == std::filesystem::path("videos") / "episode_1");
    CHECK(server.transport->requests().empty());
}

TEST_CASE("SegmentedRemoteFile::download", "[segmented][download]") {
    Server server;
    test::TempDir dir;
    const auto target = dir / "master.mp4";

    SECTION("Concatenation") {
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());
        file.naming().directory(dir.path().string());

        core::TransferProgress last;
        auto path = file.download([&last](const core::TransferProgress& p) { last = p; });
        REQUIRE(path.has_value());
        CHECK(*path == target);
        CHECK(test::slurp(target) == server.content);
        CHECK_FALSE(std::filesystem::exists(dir / "master"));
        CHECK_FALSE(std::filesystem::exists(dir / "master.mp4.part"));

        CHECK(last.items_done == 3);
        CHECK(last.items_total == 3);
        CHECK(last.downloaded_bytes == 250);
    }

    SECTION("Remuxing a local playlist") {
        auto remuxer = std::make_shared<FakeRemuxer>();
        auto options = test::fast_options();
        options.headers["Referer"] = "https://example.com/";
        SegmentedRemoteFile file(MASTER_URL, server.transport, options, remuxer);
        file.naming().directory(dir.path().string());

        auto path = file.download();
        REQUIRE(path.has_value());
        CHECK(test::slurp(target) == "remuxed");
        CHECK(remuxer->output_path == dir / ".tmp.master.mp4");
        CHECK(remuxer->received_headers.at("Referer") == "https://example.com/");
        CHECK(remuxer->segment_files == std::vector<std::string>{
            "playlist.m3u8", "segment00000.ts", "segment00001.ts", "segment00002.ts"});
        CHECK(remuxer->manifest_text ==
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:8\n"
            "#EXTINF:8.0,\n"
            "segment00000.ts\n"
            "#EXTINF:8.0,\n"
            "segment00001.ts\n"
            "#EXTINF:4.0,\n"
            "segment00002.ts\n"
            "#EXT-X-ENDLIST\n");
        CHECK_FALSE(std::filesystem::exists(dir / "master"));
    }

    SECTION("Remuxer failure leaves no output") {
        auto remuxer = std::make_shared<FakeRemuxer>(true);
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options(), remuxer);
        file.naming().directory(dir.path().string());

        auto path = file.download();
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error() == make_error_code(StreamErrc::tool_error));
        CHECK_FALSE(std::filesystem::exists(target));
        CHECK_FALSE(std::filesystem::exists(dir / ".tmp.master.mp4"));
        CHECK(std::filesystem::exists(dir / "master" / "segment00002.ts"));

        SECTION("Downloaded segments are reused") {
            server.transport->clear_requests();
            file.remuxer(std::make_shared<FakeRemuxer>());
            REQUIRE(file.download().has_value());
            CHECK_FALSE(server.requested("https://example.com/hls/high/seg0.ts"));
        }
    }

    SECTION("Existing output is kept") {
        test::spill(target, "done");
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());
        file.naming().directory(dir.path().string());

        REQUIRE(file.download().has_value());
        CHECK(test::slurp(target) == "done");
        CHECK(server.transport->requests().empty());
    }

    SECTION("Unlink") {
        SegmentedRemoteFile file(MASTER_URL, server.transport, test::fast_options());
        file.naming().directory(dir.path().string());
        REQUIRE(file.download().has_value());

        REQUIRE_FALSE(file.unlink());
        CHECK_FALSE(std::filesystem::exists(target));
        CHECK_FALSE(file.unlink());
    }
}

TEST_CASE("FfmpegRemuxer", "[remux]") {
    SECTION("Argument vector") {
        FfmpegRemuxer ffmpeg("/opt/ffmpeg/bin/ffmpeg");
        auto args = ffmpeg.arguments("work/playlist.m3u8", "out/.tmp.video.mp4",
                                     {{"Cookie", "a=b"}, {"Referer", "https://example.com/"}});
        CHECK(args == std::vector<std::string>{
            "/opt/ffmpeg/bin/ffmpeg", "-y", "-loglevel", "error",
            "-headers", "Cookie: a=b\r\nReferer: https://example.com/\r\n",
            "-protocol_whitelist", "file,http,https,tcp,tls,crypto",
            "-allowed_extensions", "ALL",
            "-i", "work/playlist.m3u8",
            "-c", "copy",
            "out/.tmp.video.mp4"});
    }

    SECTION("No headers") {
        FfmpegRemuxer ffmpeg;
        auto args = ffmpeg.arguments("a.m3u8", "b.mp4", {});
        CHECK(args.front() == "ffmpeg");
        CHECK(std::find(args.begin(), args.end(), "-headers") == args.end());
    }

    SECTION("Exit status") {
        CHECK_FALSE(FfmpegRemuxer("true").remux("a.m3u8", "b.mp4", {}));
        CHECK(FfmpegRemuxer("false").remux("a.m3u8", "b.mp4", {}) == make_error_code(StreamErrc::tool_error));
        CHECK(FfmpegRemuxer("webfile-no-such-tool").remux("a.m3u8", "b.mp4", {})
              == make_error_code(StreamErrc::tool_error));
    }
}
