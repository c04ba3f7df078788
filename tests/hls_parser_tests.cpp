// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <webfile/media/hls_parser.hpp>

using namespace webfile::media;
using webfile::core::StreamErrc;

namespace {

constexpr const char* BASE = "https://cdn.example.com/vod/video.m3u8";

constexpr const char* MEDIA_PLAYLIST =
    "#EXTM3U\n"
    "#EXT-X-VERSION:3\n"
    "#EXT-X-TARGETDURATION:8\n"
    "#EXT-X-MEDIA-SEQUENCE:0\n"
    "#EXTINF:8.341667,\n"
    "video000.ts\n"
    "#EXTINF:8.341667,\n"
    "video001.ts\n"
    "#EXTINF:3.336667,\n"
    "https://other.example.com/video002.ts\n"
    "#EXT-X-ENDLIST\n";

constexpr const char* MASTER_PLAYLIST =
    "#EXTM3U\r\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360,CODECS=\"avc1.4d401e,mp4a.40.2\"\r\n"
    "360p/index.m3u8\r\n"
    "#EXT-X-STREAM-INF:AVERAGE-BANDWIDTH=2000000,BANDWIDTH=2500000,RESOLUTION=1280x720\r\n"
    "720p/index.m3u8\r\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=1200000,RESOLUTION=854x480\r\n"
    "/live/480p/index.m3u8\r\n";

} // namespace

TEST_CASE("HLSParser::parse - media playlist", "[hls]") {
    auto result = HLSParser::parse(MEDIA_PLAYLIST, BASE);
    REQUIRE(result.has_value());
    const auto& playlist = *result;

    CHECK_FALSE(playlist.is_master());
    CHECK_FALSE(playlist.is_endless);
    CHECK(playlist.type == HLSPlaylistType::vod);
    CHECK(playlist.target_duration == Catch::Approx(8.0));

    REQUIRE(playlist.segments.size() == 3);
    CHECK(playlist.segments[0].url == "https://cdn.example.com/vod/video000.ts");
    CHECK(playlist.segments[1].url == "https://cdn.example.com/vod/video001.ts");
    CHECK(playlist.segments[2].url == "https://other.example.com/video002.ts");
    CHECK(playlist.segments[0].duration == Catch::Approx(8.341667));
    CHECK(playlist.total_duration == Catch::Approx(20.02).margin(0.001));
    CHECK(playlist.best_variant() == nullptr);
}

TEST_CASE("HLSParser::parse - master playlist", "[hls]") {
    auto result = HLSParser::parse(MASTER_PLAYLIST, "https://cdn.example.com/live/master.m3u8");
    REQUIRE(result.has_value());
    const auto& playlist = *result;

    CHECK(playlist.is_master());
    CHECK(playlist.segments.empty());
    REQUIRE(playlist.variants.size() == 3);

    SECTION("Attributes") {
        CHECK(playlist.variants[0].bandwidth == 800000);
        CHECK(playlist.variants[0].width == 640);
        CHECK(playlist.variants[0].height == 360);
        CHECK(playlist.variants[0].codecs == "avc1.4d401e,mp4a.40.2");
        CHECK(playlist.variants[0].url == "https://cdn.example.com/live/360p/index.m3u8");
    }

    SECTION("AVERAGE-BANDWIDTH is not BANDWIDTH") {
        CHECK(playlist.variants[1].bandwidth == 2500000);
    }

    SECTION("Host-relative variant") {
        CHECK(playlist.variants[2].url == "https://cdn.example.com/live/480p/index.m3u8");
    }

    SECTION("Best variant has the highest bandwidth") {
        const auto* best = playlist.best_variant();
        REQUIRE(best != nullptr);
        CHECK(best->url == "https://cdn.example.com/live/720p/index.m3u8");
    }
}

TEST_CASE("HLSParser::parse - tags", "[hls]") {
    SECTION("Byte ranges") {
        auto result = HLSParser::parse(
            "#EXTM3U\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:1000@0\nall.ts\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:500\nall.ts\n",
            BASE);
        REQUIRE(result.has_value());
        REQUIRE(result->segments.size() == 2);
        CHECK(result->segments[0].byte_offset == 0u);
        CHECK(result->segments[0].byte_length == 1000u);
        CHECK(result->segments[1].byte_offset == 1000u);
        CHECK(result->segments[1].byte_length == 500u);
    }

    SECTION("Encryption key") {
        auto result = HLSParser::parse(
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"keys/k.bin\",IV=0x1\n#EXTINF:4,\na.ts\n",
            BASE);
        REQUIRE(result.has_value());
        CHECK(result->encryption_method == "AES-128");
        CHECK(result->encryption_key_uri == "https://cdn.example.com/vod/keys/k.bin");
    }

    SECTION("Live playlist without ENDLIST") {
        auto result = HLSParser::parse("#EXTM3U\n#EXTINF:4,\na.ts\n", BASE);
        REQUIRE(result.has_value());
        CHECK(result->is_endless);
        CHECK(result->type == HLSPlaylistType::live);
    }

    SECTION("Byte order mark") {
        auto result = HLSParser::parse("\xEF\xBB\xBF#EXTM3U\n#EXTINF:4,\na.ts\n", BASE);
        REQUIRE(result.has_value());
        CHECK(result->segments.size() == 1);
    }
}

TEST_CASE("HLSParser::parse - invalid playlists", "[hls]") {
    auto result = HLSParser::parse("<html>not found</html>", BASE);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == make_error_code(StreamErrc::invalid_playlist));

    CHECK_FALSE(HLSParser::parse("", BASE).has_value());
}

TEST_CASE("HLSParser::absolutize", "[hls]") {
    auto text = HLSParser::absolutize(MEDIA_PLAYLIST, BASE);
    CHECK(text ==
        "#EXTM3U\n"
        "#EXT-X-VERSION:3\n"
        "#EXT-X-TARGETDURATION:8\n"
        "#EXT-X-MEDIA-SEQUENCE:0\n"
        "#EXTINF:8.341667,\n"
        "https://cdn.example.com/vod/video000.ts\n"
        "#EXTINF:8.341667,\n"
        "https://cdn.example.com/vod/video001.ts\n"
        "#EXTINF:3.336667,\n"
        "https://other.example.com/video002.ts\n"
        "#EXT-X-ENDLIST\n");
}

TEST_CASE("HLSParser::rewrite", "[hls]") {
    SECTION("Segments are replaced in order") {
        auto text = HLSParser::rewrite(MEDIA_PLAYLIST, BASE,
            [](std::size_t index, const std::string&) { return "local" + std::to_string(index) + ".ts"; });
        CHECK(text.find("local0.ts\n") != std::string::npos);
        CHECK(text.find("local2.ts\n") != std::string::npos);
        CHECK(text.find("video001.ts") == std::string::npos);
    }

    SECTION("Key URIs become absolute") {
        auto text = HLSParser::rewrite(
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k.bin\"\n#EXTINF:4,\na.ts\n", BASE,
            [](std::size_t, const std::string&) { return std::string("seg.ts"); });
        CHECK(text == "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"https://cdn.example.com/vod/k.bin\"\n"
                      "#EXTINF:4,\nseg.ts\n");
    }

    SECTION("Variant lines are not segments") {
        std::size_t calls = 0;
        auto text = HLSParser::rewrite(MASTER_PLAYLIST, "https://cdn.example.com/live/master.m3u8",
            [&calls](std::size_t, const std::string& url) { ++calls; return url; });
        CHECK(calls == 0);
        CHECK(text.find("https://cdn.example.com/live/720p/index.m3u8\n") != std::string::npos);
    }
}

TEST_CASE("HLSParser::is_hls_url", "[hls]") {
    CHECK(HLSParser::is_hls_url("https://a.example/x/index.m3u8"));
    CHECK(HLSParser::is_hls_url("https://a.example/x/INDEX.M3U8?token=1"));
    CHECK_FALSE(HLSParser::is_hls_url("https://a.example/x/video.mp4"));
}
