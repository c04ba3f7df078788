// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/media/hls_parser.hpp>
#include <webfile/core/log.hpp>
#include <webfile/core/url.hpp>
#include <algorithm>
#include <charconv>
#include <regex>

namespace webfile::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_PLAYLIST_TYPE = "#EXT-X-PLAYLIST-TYPE:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";
constexpr std::string_view TAG_BYTERANGE = "#EXT-X-BYTERANGE:";
constexpr std::string_view TAG_KEYS = "#EXT-X-KEY:";

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        auto line = content.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    text = trim(text);
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

std::string attribute(const std::string& line, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(line, match, pattern)) {
        return match[1].str();
    }
    return {};
}

} // namespace

const HLSVariant* HLSPlaylist::best_variant() const noexcept {
    auto it = std::max_element(variants.begin(), variants.end(),
        [](const HLSVariant& a, const HLSVariant& b) { return a.bandwidth < b.bandwidth; });
    return it == variants.end() ? nullptr : &*it;
}

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    // Check for .m3u8 extension or HLS query parameters
    std::string lower_url;
    lower_url.reserve(url.size());
    for (char c : url) {
        lower_url += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return lower_url.find(".m3u8") != std::string::npos;
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content, std::string_view base_url) noexcept {
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);  // UTF-8 BOM
    }
    if (!trim(content).starts_with(TAG_HEADER)) {
        return std::unexpected(make_error_code(core::StreamErrc::invalid_playlist));
    }

    try {
        static const std::regex bandwidth_regex(R"((?:^|[:,])BANDWIDTH=(\d+))");
        static const std::regex resolution_regex(R"(RESOLUTION=(\d+)x(\d+))");
        static const std::regex codecs_regex(R"-(CODECS="([^"]*)")-");
        static const std::regex method_regex(R"(METHOD=([A-Z0-9-]+))");
        static const std::regex uri_regex(R"-(URI="([^"]*)")-");

        HLSPlaylist playlist;
        double current_duration = 0.0;
        std::optional<std::uint64_t> current_byte_offset;
        std::optional<std::uint64_t> current_byte_length;
        std::optional<HLSVariant> pending_variant;
        std::uint64_t next_byte_offset = 0;

        for (auto raw : split_lines(content)) {
            auto view = trim(raw);
            if (view.empty()) continue;
            const std::string line(view);

            if (line[0] == '#') {
                // Parse tags
                if (line.starts_with(TAG_TARGET_DURATION)) {
                    playlist.target_duration =
                        parse_number<double>(view.substr(TAG_TARGET_DURATION.size())).value_or(0.0);
                } else if (line.starts_with(TAG_PLAYLIST_TYPE)) {
                    auto type = trim(view.substr(TAG_PLAYLIST_TYPE.size()));
                    playlist.type = type == "VOD" ? HLSPlaylistType::vod
                                  : type == "EVENT" ? HLSPlaylistType::event
                                  : HLSPlaylistType::unknown;
                } else if (line.starts_with(TAG_STREAM_INF)) {
                    // Variant playlist, URI on the next line
                    HLSVariant variant;
                    std::smatch match;
                    const std::string attrs = line.substr(TAG_STREAM_INF.size());
                    if (std::regex_search(attrs, match, bandwidth_regex)) {
                        variant.bandwidth = parse_number<std::uint64_t>(match[1].str()).value_or(0);
                    }
                    if (std::regex_search(attrs, match, resolution_regex)) {
                        variant.width = parse_number<std::uint32_t>(match[1].str()).value_or(0);
                        variant.height = parse_number<std::uint32_t>(match[2].str()).value_or(0);
                    }
                    variant.codecs = attribute(attrs, codecs_regex);
                    pending_variant = std::move(variant);
                } else if (line.starts_with(TAG_EXTINF)) {
                    auto val = view.substr(TAG_EXTINF.size());
                    auto comma_pos = val.find(',');
                    if (comma_pos != std::string_view::npos) {
                        val = val.substr(0, comma_pos);
                    }
                    current_duration = parse_number<double>(val).value_or(0.0);
                } else if (line.starts_with(TAG_BYTERANGE)) {
                    auto val = view.substr(TAG_BYTERANGE.size());
                    auto at_pos = val.find('@');
                    current_byte_length = parse_number<std::uint64_t>(val.substr(0, at_pos));
                    current_byte_offset = at_pos != std::string_view::npos
                        ? parse_number<std::uint64_t>(val.substr(at_pos + 1))
                        : std::optional<std::uint64_t>(next_byte_offset);
                } else if (line.starts_with(TAG_KEYS)) {
                    playlist.encryption_method = attribute(line, method_regex);
                    auto uri = attribute(line, uri_regex);
                    playlist.encryption_key_uri = uri.empty() ? uri : core::Url::resolve(base_url, uri);
                } else if (line.starts_with(TAG_ENDLIST)) {
                    playlist.is_endless = false;
                }
                continue;
            }

            if (pending_variant) {
                pending_variant->url = core::Url::resolve(base_url, line);
                playlist.variants.push_back(std::move(*pending_variant));
                pending_variant.reset();
                continue;
            }

            // This is a segment URL
            HLSSegment segment;
            segment.url = core::Url::resolve(base_url, line);
            segment.duration = current_duration;
            segment.byte_offset = current_byte_offset;
            segment.byte_length = current_byte_length;
            if (current_byte_offset && current_byte_length) {
                next_byte_offset = *current_byte_offset + *current_byte_length;
            }

            playlist.segments.push_back(std::move(segment));
            playlist.total_duration += current_duration;

            // Reset for next segment
            current_duration = 0.0;
            current_byte_offset.reset();
            current_byte_length.reset();
        }

        if (playlist.type == HLSPlaylistType::unknown && !playlist.is_master()) {
            playlist.type = playlist.is_endless ? HLSPlaylistType::live : HLSPlaylistType::vod;
        }
        return playlist;
    } catch (const std::regex_error& e) {
        core::logger("webfile.hls")->error("Playlist parse failed: {}", e.what());
        return std::unexpected(make_error_code(core::StreamErrc::invalid_playlist));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string HLSParser::rewrite(std::string_view content,
                               std::string_view base_url,
                               const SegmentRewriter& replace) {
    static const std::regex uri_regex(R"-(URI="([^"]*)")-");

    std::string output;
    output.reserve(content.size());
    std::size_t segment_index = 0;
    bool variant_uri = false;

    for (auto raw : split_lines(content)) {
        auto line = trim(raw);
        if (line.empty()) continue;

        if (line.front() == '#') {
            std::string tag(line);
            std::smatch match;
            if (std::regex_search(tag, match, uri_regex)) {
                tag = match.prefix().str() + "URI=\""
                    + core::Url::resolve(base_url, match[1].str()) + "\"" + match.suffix().str();
            }
            variant_uri = line.starts_with(TAG_STREAM_INF);
            output += tag;
        } else if (variant_uri) {
            output += core::Url::resolve(base_url, line);
            variant_uri = false;
        } else {
            output += replace(segment_index++, core::Url::resolve(base_url, line));
        }
        output += '\n';
    }
    return output;
}

std::string HLSParser::absolutize(std::string_view content, std::string_view base_url) {
    return rewrite(content, base_url, [](std::size_t, const std::string& url) { return url; });
}

} // namespace webfile::media
