// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/core/config.hpp>
#include <expected>
#include <string_view>
#include <system_error>

namespace sniffer::host {

// Command line of the host executable
struct HostArgs {
    core::HostConfig config;
    bool version{false};
    bool help{false};
};

// Parse command line arguments. Unknown arguments are ignored: the browser
// appends the caller origin (and --parent-window= on Windows).
[[nodiscard]] std::expected<HostArgs, std::error_code> parse_args(int argc, char* argv[]) noexcept;

// Usage goes to stderr, stdout carries the protocol
void print_help(std::string_view program_name) noexcept;
void print_version() noexcept;

} // namespace sniffer::host
