// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace sniffer::browser {

// Native messaging framing: 4-byte native-endian length + UTF-8 JSON payload.
// Compatible with Chrome and Firefox Native Messaging API.

// Serialize payload into a complete frame (prefix included)
[[nodiscard]] std::expected<std::string, std::error_code>
encode_frame(const nlohmann::json& payload) noexcept;

// Reads frames from the browser (stdin)
class FrameReader {
public:
    explicit FrameReader(std::istream& in) noexcept : in_(in) {}

    // Next payload, std::nullopt when the peer closed the channel between frames.
    // Errors are protocol errors: truncated_frame, frame_too_large, malformed_payload.
    [[nodiscard]] std::expected<std::optional<nlohmann::json>, std::error_code> read() noexcept;

private:
    std::istream& in_;
};

// Writes frames to the browser (stdout). Safe to share between threads:
// every frame is written and flushed as one unit.
class FrameWriter {
public:
    explicit FrameWriter(std::ostream& out) noexcept : out_(out) {}

    FrameWriter(const FrameWriter&) = delete;
    FrameWriter& operator=(const FrameWriter&) = delete;

    [[nodiscard]] std::error_code write(const nlohmann::json& payload) noexcept;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace sniffer::browser
