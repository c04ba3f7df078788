// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace webfile::core {

// Replace characters that break shells and other filesystems (: | * ? \ " whitespace)
[[nodiscard]] std::string sanitize_directory(std::string_view directory);

// Same set plus '/' and '.', truncated to MAX_STEM_BYTES on a UTF-8 boundary
[[nodiscard]] std::string sanitize_filestem(std::string_view stem);

[[nodiscard]] std::string path_stem(std::string_view filename);
[[nodiscard]] std::string path_suffix(std::string_view filename);

// ".mp4" for "video/mp4; codecs=...", empty when unknown
[[nodiscard]] std::string guess_extension(std::string_view content_type);

// filename parameter of a Content-Disposition value, empty when absent
[[nodiscard]] std::string content_disposition_filename(std::string_view header);

// Output location with optional overrides. Parts left unset fall back to the
// name the server or URL suggests.
class FileNaming {
public:
    FileNaming() = default;

    void directory(std::string_view dir);
    void filename(std::string_view name);
    void filestem(std::string_view stem);
    void filesuffix(std::string_view suffix);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
    // Full name known without asking the server
    [[nodiscard]] bool is_explicit() const noexcept {
        return !filename_.empty() || (!filestem_.empty() && !filesuffix_.empty());
    }

    [[nodiscard]] std::string stem(std::string_view remote_name) const;
    [[nodiscard]] std::string suffix(std::string_view remote_name, std::string_view mime_suffix = {}) const;
    [[nodiscard]] std::string filename(std::string_view remote_name, std::string_view mime_suffix = {}) const;
    [[nodiscard]] std::filesystem::path path(std::string_view remote_name, std::string_view mime_suffix = {}) const;

private:
    std::filesystem::path directory_{"."};
    std::string filename_;
    std::string filestem_;
    std::string filesuffix_;
};

} // namespace webfile::core
