// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/file_name.hpp>
#include <webfile/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace webfile::core {

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string replace_chars(std::string_view text, std::string_view forbidden) {
    std::string result(text);
    for (char& c : result) {
        if (is_space(c) || forbidden.find(c) != std::string_view::npos) {
            c = '_';
        }
    }
    return result;
}

std::string lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 24> MIME_EXTENSIONS{{
    {"video/mp4", ".mp4"},
    {"video/mp2t", ".ts"},
    {"video/webm", ".webm"},
    {"video/x-matroska", ".mkv"},
    {"video/quicktime", ".mov"},
    {"audio/mpeg", ".mp3"},
    {"audio/mp4", ".m4a"},
    {"audio/aac", ".aac"},
    {"application/vnd.apple.mpegurl", ".m3u8"},
    {"application/x-mpegurl", ".m3u8"},
    {"image/jpeg", ".jpg"},
    {"image/png", ".png"},
    {"image/gif", ".gif"},
    {"image/webp", ".webp"},
    {"text/plain", ".txt"},
    {"text/html", ".html"},
    {"text/css", ".css"},
    {"application/json", ".json"},
    {"application/javascript", ".js"},
    {"application/xml", ".xml"},
    {"application/pdf", ".pdf"},
    {"application/zip", ".zip"},
    {"application/gzip", ".gz"},
    {"application/octet-stream", ".bin"},
}};

} // namespace

std::string sanitize_directory(std::string_view directory) {
    return replace_chars(directory, ":|*?\\\"");
}

std::string sanitize_filestem(std::string_view stem) {
    std::string truncated(stem);
    if (truncated.size() > MAX_STEM_BYTES) {
        // Cut before the code point that crosses the limit
        std::size_t cut = MAX_STEM_BYTES;
        while (cut > 0 && (static_cast<unsigned char>(truncated[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        truncated.resize(cut);
    }
    return replace_chars(truncated, "/:|*.?\\\"");
}

std::string path_stem(std::string_view filename) {
    return std::filesystem::path(filename).stem().string();
}

std::string path_suffix(std::string_view filename) {
    auto ext = std::filesystem::path(filename).extension().string();
    return ext == "." ? std::string{} : ext;
}

std::string guess_extension(std::string_view content_type) {
    auto semicolon = content_type.find(';');
    auto mime = lower(content_type.substr(0, semicolon));
    while (!mime.empty() && is_space(mime.back())) mime.pop_back();
    while (!mime.empty() && is_space(mime.front())) mime.erase(mime.begin());

    for (const auto& [type, extension] : MIME_EXTENSIONS) {
        if (mime == type) {
            return std::string(extension);
        }
    }
    return {};
}

std::string content_disposition_filename(std::string_view header) {
    auto pos = header.find("filename=");
    if (pos == std::string_view::npos) {
        return {};
    }

    auto value = header.substr(pos + 9);
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        const char quote = value.front();
        value.remove_prefix(1);
        return std::string(value.substr(0, value.find(quote)));
    }

    value = value.substr(0, value.find(';'));
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

//=============================================================================
// FileNaming
//=============================================================================

void FileNaming::directory(std::string_view dir) {
    if (!dir.empty()) {
        directory_ = sanitize_directory(dir);
    }
}

void FileNaming::filename(std::string_view name) {
    if (!name.empty()) {
        filename_ = name;
    }
}

void FileNaming::filestem(std::string_view stem) {
    if (!stem.empty()) {
        filestem_ = sanitize_filestem(stem);
    }
}

void FileNaming::filesuffix(std::string_view suffix) {
    if (!suffix.empty()) {
        filesuffix_ = suffix;
    }
}

std::string FileNaming::stem(std::string_view remote_name) const {
    if (!filestem_.empty()) return filestem_;
    if (!filename_.empty()) return path_stem(filename_);
    return path_stem(remote_name);
}

std::string FileNaming::suffix(std::string_view remote_name, std::string_view mime_suffix) const {
    if (!filesuffix_.empty()) return filesuffix_;
    if (!filename_.empty()) return path_suffix(filename_);
    if (!mime_suffix.empty()) return std::string(mime_suffix);
    return path_suffix(remote_name);
}

std::string FileNaming::filename(std::string_view remote_name, std::string_view mime_suffix) const {
    if (!filename_.empty()) return filename_;
    return stem(remote_name) + suffix(remote_name, mime_suffix);
}

std::filesystem::path FileNaming::path(std::string_view remote_name, std::string_view mime_suffix) const {
    return directory_ / filename(remote_name, mime_suffix);
}

} // namespace webfile::core
