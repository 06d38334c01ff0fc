// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace sniffer::job {

// HTTP header values forwarded to the capture tool. Empty means absent.
struct CaptureHeaders {
    std::string user_agent;
    std::string referer;
    std::string cookie;
};

// Job lifecycle
enum class JobState : std::uint8_t {
    created,     // Path reserved, command built
    started,     // "starting" sent, tool launched
    completed,   // Tool exited with 0
    failed       // Launch failure, non-zero exit, timeout or cancel
};

// One capture-and-save operation, backed by one subprocess invocation
struct Job {
    std::uint64_t id{0};
    std::string url;
    std::filesystem::path output_path;
    CaptureHeaders headers;
};

} // namespace sniffer::job
