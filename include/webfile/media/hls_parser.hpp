// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webfile::media {

// HLS (HTTP Live Streaming) segment
struct HLSSegment {
    std::string url;                // Absolute
    double duration{0.0};           // Segment duration in seconds
    std::optional<std::uint64_t> byte_offset;  // For byterange playlists
    std::optional<std::uint64_t> byte_length;
};

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bitrate in bps
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::string codecs;
    std::string url;                // Absolute
};

// Playlist types
enum class HLSPlaylistType {
    unknown,
    vod,          // Video on demand
    event,        // Event
    live          // Live stream
};

// Parsed HLS playlist
struct HLSPlaylist {
    HLSPlaylistType type{HLSPlaylistType::unknown};
    std::vector<HLSSegment> segments;
    std::vector<HLSVariant> variants;
    double target_duration{0.0};
    double total_duration{0.0};
    bool is_endless{true};          // No #EXT-X-ENDLIST
    std::string encryption_method;
    std::string encryption_key_uri;

    [[nodiscard]] bool is_master() const noexcept { return !variants.empty(); }

    // Highest bandwidth variant, nullptr for media playlists
    [[nodiscard]] const HLSVariant* best_variant() const noexcept;
};

// HLS M3U8 parser
class HLSParser {
public:
    // Maps (segment index, absolute segment URL) to the text written in its place
    using SegmentRewriter = std::function<std::string(std::size_t, const std::string&)>;

    // Parse M3U8 playlist content, relative URIs resolved against base_url
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content, std::string_view base_url) noexcept;

    // Same playlist text with every segment line replaced through `replace`
    // and URI attributes of tags made absolute
    [[nodiscard]] static std::string
    rewrite(std::string_view content, std::string_view base_url, const SegmentRewriter& replace);

    // Same playlist text with absolute URIs
    [[nodiscard]] static std::string
    absolutize(std::string_view content, std::string_view base_url);

    // Check if URL is an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;
};

} // namespace webfile::media
