// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/cli/commands.hpp>
#include <webfile/cli/progress_bar.hpp>
#include <webfile/core/caching_resource.hpp>
#include <webfile/core/error.hpp>
#include <webfile/core/log.hpp>
#include <webfile/core/remote_resource.hpp>
#include <webfile/disk/fragment_store.hpp>
#include <webfile/media/hls_parser.hpp>
#include <webfile/media/remuxer.hpp>
#include <webfile/media/segmented_file.hpp>
#include <webfile/version.hpp>
#include <iostream>

namespace webfile::cli {

namespace {

void report(std::string_view what, const std::string& url, const std::error_code& ec) {
    std::cerr << "Error: " << what << " " << url << ": " << ec.message() << std::endl;
}

// Draws TransferProgress, bytes for plain resources, segments for playlists
class ProgressView {
public:
    ProgressView(bool enabled, std::string_view label, ProgressBar::Unit unit)
        : enabled_(enabled), bar_(label, unit) {}

    ~ProgressView() { bar_.finish(); }

    ProgressView(const ProgressView&) = delete;
    ProgressView& operator=(const ProgressView&) = delete;

    [[nodiscard]] core::ProgressCallback callback() {
        if (!enabled_) return {};
        return [this](const core::TransferProgress& p) {
            if (bar_.unit() == ProgressBar::Unit::items) {
                bar_.update(p.items_done, p.items_total);
            } else {
                bar_.update(p.downloaded_bytes, p.total_bytes);
            }
        };
    }

    void fail() noexcept { bar_.clear(); }

private:
    bool enabled_;
    ProgressBar bar_;
};

void apply_naming(core::FileNaming& naming, const CliArgs& args, const core::Settings& settings) {
    naming.directory(args.output_dir.empty() ? settings.output_directory : args.output_dir);
    naming.filename(args.output_file);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value = [&](int& i, std::string_view option) -> std::string {
        if (i + 1 < argc) {
            return argv[++i];
        }
        if (args.error.empty()) {
            args.error = std::string(option) + " requires a value";
        }
        return {};
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            args.output_file = value(i, arg);
        } else if (arg == "-d" || arg == "--directory") {
            args.output_dir = value(i, arg);
        } else if (arg == "-c" || arg == "--config") {
            args.config_path = value(i, arg);
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--exists") {
            args.exists = true;
        } else if (arg == "--cached") {
            args.cached = true;
        } else if (arg == "--no-remux") {
            args.no_remux = true;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            if (args.error.empty()) {
                args.error = "Unknown option " + arg;
            }
        } else {
            // URL arguments (no option)
            args.urls.push_back(arg);
        }
    }

    return args;
}

std::expected<core::Settings, std::error_code> load_settings(const CliArgs& args) noexcept {
    core::Settings settings;
    if (!args.config_path.empty()) {
        auto loaded = core::Settings::load(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }

    auto level = spdlog::level::from_str(settings.log_level);
    if (level == spdlog::level::off && settings.log_level != "off") {
        level = spdlog::level::info;
    }
    if (args.verbose) level = spdlog::level::debug;
    if (args.quiet) level = spdlog::level::warn;
    core::set_log_level(level);

    return settings;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::string& url, const CliArgs& args, const Context& ctx) noexcept {
    auto options = core::RequestOptions::from(ctx.settings);

    if (media::HLSParser::is_hls_url(url)) {
        std::shared_ptr<media::Remuxer> remuxer;
        if (!args.no_remux) {
            remuxer = std::make_shared<media::FfmpegRemuxer>(ctx.settings.ffmpeg);
        }

        media::SegmentedRemoteFile file(url, ctx.transport, std::move(options), std::move(remuxer));
        apply_naming(file.naming(), args, ctx.settings);

        ProgressView view(ctx.progress, "Segments", ProgressBar::Unit::items);
        auto path = file.download(view.callback());
        if (!path) {
            view.fail();
            report("Cannot download", url, path.error());
            return std::unexpected(path.error());
        }
        std::cout << path->string() << std::endl;
        return 0;
    }

    auto resource = std::make_unique<core::RemoteResource>(url, ctx.transport, std::move(options));
    apply_naming(resource->naming(), args, ctx.settings);

    ProgressView view(ctx.progress, {}, ProgressBar::Unit::bytes);
    std::expected<std::filesystem::path, std::error_code> path;

    if (args.cached) {
        auto target = resource->filepath();
        if (!target) {
            report("Cannot resolve", url, target.error());
            return std::unexpected(target.error());
        }
        core::CachingResource cached(std::move(resource),
                                     std::make_unique<disk::PartialDownloadStore>(*target),
                                     ctx.settings.chunk_size);
        path = cached.download(view.callback());
    } else {
        path = resource->download(view.callback());
    }

    if (!path) {
        view.fail();
        report("Cannot download", url, path.error());
        return std::unexpected(path.error());
    }
    std::cout << path->string() << std::endl;
    return 0;
}

CliResult info(const std::string& url, const Context& ctx) noexcept {
    auto options = core::RequestOptions::from(ctx.settings);

    if (media::HLSParser::is_hls_url(url)) {
        media::SegmentedRemoteFile file(url, ctx.transport, std::move(options));
        auto playlist = file.playlist();
        if (!playlist) {
            report("Cannot read playlist", url, playlist.error());
            return std::unexpected(playlist.error());
        }

        const media::HLSPlaylist& p = **playlist;
        std::cout << "URL: " << url << std::endl;
        std::cout << "File: " << file.filepath().string() << std::endl;
        std::cout << "Segments: " << p.segments.size() << std::endl;
        std::cout << "Duration: " << ProgressBar::format_time(static_cast<std::uint64_t>(p.total_duration))
                  << std::endl;
        std::cout << "Live: " << (p.is_endless ? "yes" : "no") << std::endl;
        if (!p.encryption_method.empty()) {
            std::cout << "Encryption: " << p.encryption_method << std::endl;
        }

        auto manifest = file.manifest();
        if (manifest) {
            std::cout << std::endl << *manifest;
        }
        return 0;
    }

    core::RemoteResource resource(url, ctx.transport, std::move(options));
    auto meta = resource.metadata();
    if (!meta) {
        report("Cannot fetch", url, meta.error());
        return std::unexpected(meta.error());
    }
    auto size = resource.size();
    auto path = resource.filepath();

    std::cout << "URL: " << resource.url() << std::endl;
    std::cout << "Status: " << meta->status_code << std::endl;
    std::cout << "Content-Type: " << meta->content_type << std::endl;
    std::cout << "Content-Length: ";
    if (size && *size) {
        std::cout << **size << " (" << ProgressBar::format_bytes(**size) << ")";
    } else {
        std::cout << "unknown";
    }
    std::cout << std::endl;
    std::cout << "Accepts-Ranges: " << (meta->accepts_ranges ? "yes" : "no") << std::endl;
    if (path) {
        std::cout << "File: " << path->string() << std::endl;
    }
    return 0;
}

CliResult exists(const std::string& url, const Context& ctx) noexcept {
    auto options = core::RequestOptions::from(ctx.settings);

    std::expected<bool, std::error_code> found;
    if (media::HLSParser::is_hls_url(url)) {
        media::SegmentedRemoteFile file(url, ctx.transport, std::move(options));
        found = file.exists();
    } else {
        core::RemoteResource resource(url, ctx.transport, std::move(options));
        found = resource.exists();
    }

    if (!found) {
        report("Cannot check", url, found.error());
        return std::unexpected(found.error());
    }
    std::cout << url << ": " << (*found ? "exists" : "not found") << std::endl;
    return *found ? 0 : 2;
}

void print_help(std::string_view program_name) {
    std::cout << "webfile " << version.to_string() << " - resumable HTTP and HLS downloader\n"
              << "\n"
              << "Usage: " << program_name << " [options] URL...\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output FILE      Output file name\n"
              << "  -d, --directory DIR    Output directory\n"
              << "  -c, --config FILE      JSON settings file\n"
              << "  -i, --info             Show metadata, do not download\n"
              << "      --exists           Check whether the resource exists\n"
              << "      --cached           Download through the fragment cache\n"
              << "      --no-remux         Concatenate HLS segments instead of running ffmpeg\n"
              << "  -V, --verbose          Debug logging\n"
              << "  -q, --quiet            Warnings and errors only, no progress\n"
              << "  -h, --help             Show this help\n"
              << "  -v, --version          Show version\n";
}

void print_version() {
    std::cout << "webfile " << version.to_string()
              << " (built " << BUILD_DATE << " " << BUILD_TIME << ")" << std::endl;
}

} // namespace webfile::cli
