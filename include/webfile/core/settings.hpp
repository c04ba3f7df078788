// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/config.hpp>
#include <webfile/core/retry.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace webfile::core {

// Runtime configuration, JSON file overridable from the command line
struct Settings {
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds read_timeout{READ_TIMEOUT_SEC};

    std::uint32_t retry_attempts{RETRY_COUNT};
    std::chrono::milliseconds retry_base_delay{RETRY_BASE_DELAY};
    std::chrono::milliseconds retry_jitter_min{RETRY_JITTER_MIN};
    std::chrono::milliseconds retry_jitter_max{RETRY_JITTER_MAX};

    std::size_t chunk_size{DOWNLOAD_CHUNK_SIZE};
    std::string user_agent{DEFAULT_USER_AGENT};
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;

    std::string output_directory{"."};
    std::string ffmpeg{"ffmpeg"};
    std::string log_level{"info"};

    [[nodiscard]] RetryPolicy retry_policy() const;

    // Parse a JSON document; keys that are absent keep their defaults
    [[nodiscard]] static std::expected<Settings, std::error_code>
    parse(std::string_view json) noexcept;

    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::filesystem::path& path) noexcept;
};

} // namespace webfile::core
