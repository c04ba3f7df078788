// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace webfile::core {

// Named component logger ("webfile.remote", "webfile.store", ...), created on
// first use and sharing one stderr sink
[[nodiscard]] std::shared_ptr<spdlog::logger> logger(std::string_view name);

// Level for every webfile logger, existing and future
void set_log_level(spdlog::level::level_enum level) noexcept;

[[nodiscard]] spdlog::level::level_enum log_level() noexcept;

} // namespace webfile::core
