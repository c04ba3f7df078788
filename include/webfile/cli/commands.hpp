// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/http_session.hpp>
#include <webfile/core/settings.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace webfile::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string config_path;
    std::string error;          // First parse error, empty when none
    bool info{false};
    bool exists{false};
    bool cached{false};
    bool no_remux{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Everything a command needs besides its URL
struct Context {
    core::Settings settings;
    std::shared_ptr<core::HttpTransport> transport;
    bool progress{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Settings from the config file with command line overrides applied
[[nodiscard]] std::expected<core::Settings, std::error_code> load_settings(const CliArgs& args) noexcept;

// Download a single URL, HLS playlists are detected by their ".m3u8"
[[nodiscard]] CliResult download(const std::string& url, const CliArgs& args, const Context& ctx) noexcept;

// Print metadata without downloading
[[nodiscard]] CliResult info(const std::string& url, const Context& ctx) noexcept;

// Print whether the resource exists; exit code 0 when it does, 2 when it does not
[[nodiscard]] CliResult exists(const std::string& url, const Context& ctx) noexcept;

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace webfile::cli
