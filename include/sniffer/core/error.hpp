// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace sniffer::core {

enum class HostErrc {
    success = 0,
    truncated_frame,
    frame_too_large,
    malformed_payload,
    channel_write_failed,
    invalid_request,
    launch_failed,
    tool_failed,
    timed_out,
    cancelled,
    invalid_argument,
};

namespace detail {

struct HostErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "sniffer::host";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<HostErrc>(ev)) {
            case HostErrc::success:              return "Success";
            case HostErrc::truncated_frame:      return "Truncated message frame";
            case HostErrc::frame_too_large:      return "Message frame too large";
            case HostErrc::malformed_payload:    return "Malformed message payload";
            case HostErrc::channel_write_failed: return "Failed to write to channel";
            case HostErrc::invalid_request:      return "Missing or invalid url";
            case HostErrc::launch_failed:        return "Failed to launch capture tool";
            case HostErrc::tool_failed:          return "Capture tool failed";
            case HostErrc::timed_out:            return "Capture timed out";
            case HostErrc::cancelled:            return "Download cancelled";
            case HostErrc::invalid_argument:     return "Invalid argument";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::HostErrcCategory& host_errc_category() noexcept {
    static detail::HostErrcCategory category;
    return category;
}

inline std::error_code make_error_code(HostErrc e) noexcept {
    return {static_cast<int>(e), host_errc_category()};
}

} // namespace sniffer::core

namespace std {

template<>
struct is_error_code_enum<sniffer::core::HostErrc> : true_type {};

} // namespace std

namespace sniffer::core {

// Protocol errors leave the channel in an unknown state
[[nodiscard]] inline bool is_protocol_error(std::error_code ec) noexcept {
    return ec == make_error_code(HostErrc::truncated_frame)
        || ec == make_error_code(HostErrc::frame_too_large)
        || ec == make_error_code(HostErrc::malformed_payload);
}

} // namespace sniffer::core
