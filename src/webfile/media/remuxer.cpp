// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/media/remuxer.hpp>
#include <webfile/core/error.hpp>
#include <webfile/core/log.hpp>
#include <cerrno>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace webfile::media {

FfmpegRemuxer::FfmpegRemuxer(std::string program)
    : program_(program.empty() ? std::string("ffmpeg") : std::move(program)) {}

std::vector<std::string>
FfmpegRemuxer::arguments(const std::filesystem::path& manifest,
                         const std::filesystem::path& output,
                         const std::map<std::string, std::string>& headers) const {
    std::vector<std::string> args{program_, "-y", "-loglevel", "error"};

    if (!headers.empty()) {
        std::string joined;
        for (const auto& [name, value] : headers) {
            joined += name + ": " + value + "\r\n";
        }
        args.push_back("-headers");
        args.push_back(std::move(joined));
    }

    args.insert(args.end(), {
        "-protocol_whitelist", "file,http,https,tcp,tls,crypto",
        "-allowed_extensions", "ALL",
        "-i", manifest.string(),
        "-c", "copy",
        output.string(),
    });
    return args;
}

std::error_code FfmpegRemuxer::remux(const std::filesystem::path& manifest,
                                     const std::filesystem::path& output,
                                     const std::map<std::string, std::string>& headers) noexcept {
    auto log = core::logger("webfile.remux");

    std::vector<std::string> args;
    try {
        args = arguments(manifest, output, headers);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    log->debug("Running {} on {}", program_, manifest.string());

    pid_t pid;
    const int rc = ::posix_spawnp(&pid, program_.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        log->error("Cannot start {}: {}", program_, std::error_code{rc, std::system_category()}.message());
        return make_error_code(core::StreamErrc::tool_error);
    }

    int st = 0;
    while (::waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) {
            log->error("Waiting for {} failed: {}", program_,
                       std::error_code{errno, std::system_category()}.message());
            return make_error_code(core::StreamErrc::tool_error);
        }
    }

    if (!(WIFEXITED(st) && WEXITSTATUS(st) == 0)) {
        log->error("{} failed on {} (status {})", program_, manifest.string(),
                   WIFEXITED(st) ? WEXITSTATUS(st) : -1);
        return make_error_code(core::StreamErrc::tool_error);
    }
    return {};
}

} // namespace webfile::media
