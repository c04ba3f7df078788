// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace webfile::core {

namespace {

// Collapse "." and ".." segments of an absolute path
std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> segments;
    bool trailing_slash = false;

    std::size_t pos = 1;  // Skip the leading '/'
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        auto segment = path.substr(pos, next - pos);
        const bool last = next == path.size();

        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }
        pos = next + 1;
    }

    std::string result;
    for (auto segment : segments) {
        result += '/';
        result += segment;
    }
    if (result.empty() || (trailing_slash && result.back() != '/')) {
        result += '/';
    }
    return result;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(StreamErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    std::size_t authority_start = rest_start;

    // Skip user:pass@
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end != std::string_view::npos && bracket_end < host_end) {
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            auto ipv6_colon = url_str.find(':', bracket_end);
            if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
                url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
            }
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    // Path runs from the first '/' after the authority up to '?' or '#'
    auto path_end = std::min(query_start, fragment_start);
    if (path_start < path_end) {
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    if (scheme_ == "sftp") return 22;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

std::string Url::resolve(std::string_view reference) const {
    auto scheme_end = reference.find("://");
    if (scheme_end != std::string_view::npos && scheme_end > 0
        && reference.find_first_of("/?#") > scheme_end) {
        return std::string(reference);
    }
    if (reference.empty()) {
        return full();
    }

    if (reference.starts_with("//")) {
        return scheme_ + ":" + std::string(reference);
    }

    std::string suffix;
    std::string_view ref_path = reference;
    auto tail = ref_path.find_first_of("?#");
    if (tail != std::string_view::npos) {
        suffix = std::string(ref_path.substr(tail));
        ref_path = ref_path.substr(0, tail);
    }

    if (ref_path.empty()) {
        // "?query" or "#fragment" keeps the current path
        std::string result = base() + path_;
        if (suffix.front() == '#' && !query_.empty()) {
            result += "?" + query_;
        }
        return result + suffix;
    }

    if (ref_path.front() == '/') {
        return base() + normalize_path(ref_path) + suffix;
    }

    // Relative to the directory of the current path
    std::string dir = path_.substr(0, path_.rfind('/') + 1);
    return base() + normalize_path(dir + std::string(ref_path)) + suffix;
}

std::string Url::resolve(std::string_view base, std::string_view reference) {
    auto parsed = Url::parse(base);
    if (!parsed) {
        return std::string(reference);
    }
    return parsed->resolve(reference);
}

} // namespace webfile::core
