// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/settings.hpp>
#include <webfile/core/log.hpp>
#include <webfile/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace webfile::core {

namespace {

// {
//   "connect_timeout_sec": 30, "read_timeout_sec": 30,
//   "retry": {"attempts": 5, "base_delay_ms": 1000, "jitter_min_ms": 1000, "jitter_max_ms": 5000},
//   "chunk_size": 65536, "user_agent": "...",
//   "headers": {"Referer": "..."}, "cookies": {"session": "..."},
//   "output_directory": ".", "ffmpeg": "ffmpeg", "log_level": "info"
// }
void apply(const nlohmann::json& j, Settings& s) {
    if (j.contains("connect_timeout_sec")) {
        s.connect_timeout = std::chrono::seconds{j["connect_timeout_sec"].get<std::int64_t>()};
    }
    if (j.contains("read_timeout_sec")) {
        s.read_timeout = std::chrono::seconds{j["read_timeout_sec"].get<std::int64_t>()};
    }

    if (j.contains("retry") && j["retry"].is_object()) {
        const auto& r = j["retry"];
        if (r.contains("attempts")) {
            s.retry_attempts = r["attempts"].get<std::uint32_t>();
        }
        if (r.contains("base_delay_ms")) {
            s.retry_base_delay = std::chrono::milliseconds{r["base_delay_ms"].get<std::int64_t>()};
        }
        if (r.contains("jitter_min_ms")) {
            s.retry_jitter_min = std::chrono::milliseconds{r["jitter_min_ms"].get<std::int64_t>()};
        }
        if (r.contains("jitter_max_ms")) {
            s.retry_jitter_max = std::chrono::milliseconds{r["jitter_max_ms"].get<std::int64_t>()};
        }
    }

    if (j.contains("chunk_size")) {
        auto size = j["chunk_size"].get<std::size_t>();
        if (size > 0) s.chunk_size = size;
    }
    if (j.contains("user_agent")) {
        s.user_agent = j["user_agent"].get<std::string>();
    }

    if (j.contains("headers") && j["headers"].is_object()) {
        for (auto& [key, value] : j["headers"].items()) {
            s.headers[key] = value.get<std::string>();
        }
    }
    if (j.contains("cookies") && j["cookies"].is_object()) {
        for (auto& [key, value] : j["cookies"].items()) {
            s.cookies[key] = value.get<std::string>();
        }
    }

    if (j.contains("output_directory")) {
        s.output_directory = j["output_directory"].get<std::string>();
    }
    if (j.contains("ffmpeg")) {
        s.ffmpeg = j["ffmpeg"].get<std::string>();
    }
    if (j.contains("log_level")) {
        s.log_level = j["log_level"].get<std::string>();
    }
}

} // namespace

RetryPolicy Settings::retry_policy() const {
    return RetryPolicy(retry_attempts, retry_base_delay, RETRY_MULTIPLIER,
                       retry_jitter_min, retry_jitter_max);
}

std::expected<Settings, std::error_code> Settings::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        Settings settings;
        core::apply(j, settings);
        return settings;
    } catch (const std::exception& e) {
        logger("webfile.settings")->error("Invalid settings: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::expected<Settings, std::error_code> Settings::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream content;
        content << file.rdbuf();
        return parse(content.str());
    } catch (const std::exception& e) {
        logger("webfile.settings")->error("Cannot read {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace webfile::core
