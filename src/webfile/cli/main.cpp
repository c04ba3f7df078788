// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/cli/commands.hpp>
#include <webfile/cli/progress_bar.hpp>
#include <webfile/core/http_session.hpp>
#include <webfile/version.hpp>
#include <iostream>
#include <memory>

using namespace webfile;
using namespace webfile::cli;

int main(int argc, char* argv[]) {
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    auto settings = load_settings(args);
    if (!settings) {
        std::cerr << "Error: Cannot load " << args.config_path << ": "
                  << settings.error().message() << std::endl;
        return 1;
    }

    core::HttpSession::global_init();

    Context ctx;
    ctx.settings = std::move(*settings);
    ctx.transport = std::make_shared<core::HttpSession>();
    ctx.progress = ProgressBar::enabled(args.quiet);

    int exit_code = 0;
    for (const auto& url : args.urls) {
        CliResult result;
        if (args.exists) {
            result = exists(url, ctx);
        } else if (args.info) {
            result = info(url, ctx);
        } else {
            result = download(url, args, ctx);
        }

        if (!result) {
            exit_code = 1;
        } else if (*result != 0 && exit_code == 0) {
            exit_code = *result;
        }
    }

    ctx.transport.reset();
    core::HttpSession::global_cleanup();
    return exit_code;
}
