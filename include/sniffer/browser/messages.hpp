// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/job/job.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace sniffer::browser {

enum class Action {
    download,
    ping,
    unknown
};

// DOWNLOAD request as sent by the extension
struct DownloadRequest {
    std::string url;
    std::string filename;
    job::CaptureHeaders headers;
};

// Route key of a decoded payload; anything unrecognized maps to Action::unknown
[[nodiscard]] Action action_of(const nlohmann::json& message) noexcept;

// Extract a DownloadRequest. Fails with invalid_request when url is missing.
[[nodiscard]] std::expected<DownloadRequest, std::error_code>
parse_download_request(const nlohmann::json& message) noexcept;

// Outbound status events
namespace events {

[[nodiscard]] nlohmann::json starting(const std::filesystem::path& file);
[[nodiscard]] nlohmann::json complete(const std::filesystem::path& file);
[[nodiscard]] nlohmann::json error(std::string_view message);
[[nodiscard]] nlohmann::json pong();

// Channel-level failure, not tied to a job
[[nodiscard]] nlohmann::json fatal(std::string_view message);

} // namespace events

} // namespace sniffer::browser
