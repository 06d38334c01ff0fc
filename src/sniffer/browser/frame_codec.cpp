// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/browser/frame_codec.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/core/logging.hpp>
#include <cstring>
#include <new>

namespace sniffer::browser {

using core::HostErrc;
using nlohmann::json;

std::expected<std::string, std::error_code> encode_frame(const json& payload) noexcept {
    try {
        // Replace invalid UTF-8 (e.g. from tool output) instead of throwing
        std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
        if (body.size() > core::MAX_OUTBOUND_FRAME_SIZE) {
            return std::unexpected(make_error_code(HostErrc::frame_too_large));
        }

        auto length = static_cast<std::uint32_t>(body.size());
        std::string frame(sizeof(length) + body.size(), '\0');
        std::memcpy(frame.data(), &length, sizeof(length));
        std::memcpy(frame.data() + sizeof(length), body.data(), body.size());
        return frame;
    } catch (const std::exception& e) {
        core::logger()->error("Failed to serialize frame: {}", e.what());
        return std::unexpected(make_error_code(HostErrc::malformed_payload));
    }
}

//=============================================================================
// FrameReader
//=============================================================================

std::expected<std::optional<json>, std::error_code> FrameReader::read() noexcept {
    // Read 4-byte length prefix
    std::uint32_t length = 0;
    in_.read(reinterpret_cast<char*>(&length), sizeof(length));

    const auto prefix_read = in_.gcount();
    if (prefix_read == 0) {
        return std::optional<json>{};  // EOF
    }
    if (prefix_read != static_cast<std::streamsize>(sizeof(length))) {
        return std::unexpected(make_error_code(HostErrc::truncated_frame));
    }

    if (length > core::MAX_INBOUND_FRAME_SIZE) {
        core::logger()->error("Inbound frame of {} bytes exceeds limit", length);
        return std::unexpected(make_error_code(HostErrc::frame_too_large));
    }

    try {
        // Read JSON payload
        std::string buffer(length, '\0');
        in_.read(buffer.data(), length);
        if (in_.gcount() != static_cast<std::streamsize>(length)) {
            core::logger()->error("Frame truncated: expected {} bytes, got {}", length, in_.gcount());
            return std::unexpected(make_error_code(HostErrc::truncated_frame));
        }

        return std::optional<json>{json::parse(buffer)};
    } catch (const json::exception& e) {
        core::logger()->error("Malformed payload: {}", e.what());
        return std::unexpected(make_error_code(HostErrc::malformed_payload));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(HostErrc::frame_too_large));
    }
}

//=============================================================================
// FrameWriter
//=============================================================================

std::error_code FrameWriter::write(const json& payload) noexcept {
    auto frame = encode_frame(payload);
    if (!frame) {
        return frame.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(frame->data(), static_cast<std::streamsize>(frame->size()));
    out_.flush();

    if (!out_) {
        return make_error_code(HostErrc::channel_write_failed);
    }
    return {};
}

} // namespace sniffer::browser
