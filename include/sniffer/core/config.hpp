// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sniffer::core {

constexpr std::uint32_t MAX_INBOUND_FRAME_SIZE = 64 * 1024 * 1024;   // 64 MB
constexpr std::uint32_t MAX_OUTBOUND_FRAME_SIZE = 1024 * 1024;       // 1 MB, browser limit

constexpr std::string_view DEFAULT_FILENAME = "video.mp4";
constexpr std::string_view DEFAULT_CAPTURE_TOOL = "ffmpeg";
constexpr std::string_view UNKNOWN_TOOL_ERROR = "Unknown FFmpeg error";

constexpr std::size_t ERROR_TAIL_CHARS = 200;
constexpr std::size_t STDERR_KEEP_BYTES = 64 * 1024;                 // 64 KB
constexpr std::size_t PIPE_READ_SIZE = 4096;

constexpr std::uint32_t DEFAULT_MAX_JOBS = 0;                      // 0: one worker per running job
constexpr std::uint32_t MAX_JOBS_LIMIT = 64;

constexpr std::chrono::milliseconds POLL_INTERVAL{200};
constexpr std::chrono::seconds TERMINATE_GRACE{5};

// Runtime configuration of the host
struct HostConfig {
    std::filesystem::path download_dir;            // empty: ~/Downloads
    std::string capture_tool{DEFAULT_CAPTURE_TOOL};
    std::uint32_t max_jobs{DEFAULT_MAX_JOBS};      // 0: no limit
    std::chrono::seconds job_timeout{0};           // 0: no timeout
    std::filesystem::path log_file;                // empty: stderr
    bool verbose{false};
};

} // namespace sniffer::core
