// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/host/options.hpp>
#include <sniffer/core/error.hpp>
#include <sniffer/version.hpp>
#include <charconv>
#include <iostream>
#include <string>

namespace sniffer::host {

namespace {

// Unsigned integer option value
bool parse_uint(std::string_view text, std::uint32_t& out) noexcept {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

std::expected<HostArgs, std::error_code> parse_args(int argc, char* argv[]) noexcept {
    HostArgs args;
    const auto invalid = std::unexpected(make_error_code(core::HostErrc::invalid_argument));

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Options taking a value
        auto value = [&]() -> const char* {
            return (i + 1 < argc) ? argv[++i] : nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.config.verbose = true;
        } else if (arg == "-d" || arg == "--download-dir") {
            const char* v = value();
            if (v == nullptr || *v == '\0') return invalid;
            args.config.download_dir = v;
        } else if (arg == "-f" || arg == "--ffmpeg") {
            const char* v = value();
            if (v == nullptr || *v == '\0') return invalid;
            args.config.capture_tool = v;
        } else if (arg == "-j" || arg == "--max-jobs") {
            const char* v = value();
            std::uint32_t jobs = 0;
            if (v == nullptr || !parse_uint(v, jobs) || jobs > core::MAX_JOBS_LIMIT) {
                return invalid;
            }
            args.config.max_jobs = jobs;
        } else if (arg == "-t" || arg == "--timeout") {
            const char* v = value();
            std::uint32_t seconds = 0;
            if (v == nullptr || !parse_uint(v, seconds)) return invalid;
            args.config.job_timeout = std::chrono::seconds{seconds};
        } else if (arg == "-l" || arg == "--log-file") {
            const char* v = value();
            if (v == nullptr || *v == '\0') return invalid;
            args.config.log_file = v;
        }
        // Anything else (chrome-extension://<id>/, --parent-window=N) is ignored
    }

    return args;
}

void print_help(std::string_view program_name) noexcept {
    std::cerr << "StreamSniffer companion host " << version.to_string() << "\n\n"
              << "Usage: " << program_name << " [options] [origin]\n\n"
              << "Started by the browser as native messaging host '" << HOST_NAME << "'.\n"
              << "Reads length-prefixed JSON requests on stdin, writes events on stdout.\n\n"
              << "Options:\n"
              << "  -d, --download-dir DIR   Save captures to DIR (default: ~/Downloads)\n"
              << "  -f, --ffmpeg PATH        Capture tool to run (default: ffmpeg from PATH)\n"
              << "  -j, --max-jobs N         Run at most N captures at once, 1-" << core::MAX_JOBS_LIMIT
              << ", later ones wait (default: 0, no limit)\n"
              << "  -t, --timeout SEC        Kill a capture after SEC seconds (default: 0, none)\n"
              << "  -l, --log-file FILE      Log to FILE instead of stderr\n"
              << "  -V, --verbose            Debug logging\n"
              << "  -v, --version            Show version\n"
              << "  -h, --help               Show this help\n";
}

void print_version() noexcept {
    std::cerr << "sniffer_host " << version.to_string() << "\n";
}

} // namespace sniffer::host
