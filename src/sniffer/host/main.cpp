// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/browser/native_host.hpp>
#include <sniffer/core/logging.hpp>
#include <sniffer/host/options.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

// Terminate handler to catch exceptions in noexcept functions
static void sniffer_terminate_handler() {
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
    std::set_terminate(sniffer_terminate_handler);

    // A closed browser pipe must surface as a write error, not kill the host
    std::signal(SIGPIPE, SIG_IGN);

    auto args = sniffer::host::parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error().message() << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args->help) {
        sniffer::host::print_help(argv[0]);
        return 0;
    }
    if (args->version) {
        sniffer::host::print_version();
        return 0;
    }

    if (auto ec = sniffer::core::init_logging(args->config)) {
        std::cerr << "Error: cannot open log file " << args->config.log_file << ": " << ec.message() << std::endl;
        return 1;
    }

    sniffer::browser::NativeHost host(args->config, std::cin, std::cout);
    return host.run();
}
