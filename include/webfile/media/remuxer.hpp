// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

namespace webfile::media {

// Turns a local HLS playlist into a single container file
class Remuxer {
public:
    virtual ~Remuxer() = default;

    // Streams are copied, not re-encoded. `headers` go along with any
    // remote request the tool makes (keys).
    [[nodiscard]] virtual std::error_code
    remux(const std::filesystem::path& manifest,
          const std::filesystem::path& output,
          const std::map<std::string, std::string>& headers) noexcept = 0;
};

// Runs `ffmpeg -i <manifest> -c copy <output>`
class FfmpegRemuxer final : public Remuxer {
public:
    explicit FfmpegRemuxer(std::string program = "ffmpeg");

    [[nodiscard]] std::error_code
    remux(const std::filesystem::path& manifest,
          const std::filesystem::path& output,
          const std::map<std::string, std::string>& headers) noexcept override;

    // Full argument vector, program name first
    [[nodiscard]] std::vector<std::string>
    arguments(const std::filesystem::path& manifest,
              const std::filesystem::path& output,
              const std::map<std::string, std::string>& headers) const;

private:
    std::string program_;
};

} // namespace webfile::media
