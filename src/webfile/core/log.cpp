// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace webfile::core {

namespace {

std::mutex& registry_mutex() {
    static std::mutex m;
    return m;
}

spdlog::sink_ptr shared_sink() {
    static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
}

spdlog::level::level_enum& current_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

} // namespace

std::shared_ptr<spdlog::logger> logger(std::string_view name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    std::string key(name);
    if (auto existing = spdlog::get(key)) {
        return existing;
    }

    auto created = std::make_shared<spdlog::logger>(key, shared_sink());
    created->set_pattern("%Y-%m-%d %H:%M:%S.%e %n %8l %v");
    created->set_level(current_level());
    spdlog::register_logger(created);
    return created;
}

void set_log_level(spdlog::level::level_enum level) noexcept {
    std::lock_guard<std::mutex> lock(registry_mutex());
    current_level() = level;
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level() noexcept {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return current_level();
}

} // namespace webfile::core
