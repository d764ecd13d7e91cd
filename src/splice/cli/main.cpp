// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splice/cli/commands.hpp>
#include <splice/core/curl_transport.hpp>
#include <splice/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace splicer::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void splice_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(splice_terminate_handler);

    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    auto settings = resolve_settings(args);
    if (!settings) {
        std::cerr << "Error: cannot load settings: " << settings.error().message() << std::endl;
        return 1;
    }

    if (args.verbose) {
        splicer::core::set_log_level(spdlog::level::debug);
    } else if (args.quiet) {
        splicer::core::set_log_level(spdlog::level::err);
    } else if (!splicer::core::set_log_level(settings->log_level)) {
        std::cerr << "Warning: unknown log level '" << settings->log_level << "'" << std::endl;
    }

    splicer::core::CurlTransport::global_init();
    install_interrupt_handler();

    int exit_code = 0;
    if (args.list_only) {
        for (const auto& url : args.urls) {
            if (!info(url, *settings)) exit_code = 1;
        }
    } else {
        auto result = download_all(args, *settings);
        exit_code = result ? *result : 1;
    }

    splicer::core::CurlTransport::global_cleanup();
    return exit_code;
}
