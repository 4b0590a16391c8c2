// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace surge::cli;

// Report exceptions that escape noexcept functions before aborting
static void surge_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(surge_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (args.files.empty()) {
        std::cerr << "Error: No file specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    // Logs go to stderr so they never break a progress line
    spdlog::set_default_logger(spdlog::stderr_color_mt("surge"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(args.verbose ? spdlog::level::debug
                    : args.quiet   ? spdlog::level::warn
                                   : spdlog::level::info);

    auto settings = resolve_settings(args);
    if (!settings) {
        return 1;
    }

    auto result = args.plan_only ? plan(args, *settings) : upload(args, *settings);
    if (!result) {
        return 1;
    }
    return *result;
}
