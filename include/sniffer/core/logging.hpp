// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/core/config.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <system_error>

namespace sniffer::core {

constexpr const char* LOGGER_NAME = "sniffer";

// Install the host logger. Never writes to stdout, which carries the protocol.
[[nodiscard]] std::error_code init_logging(const HostConfig& config) noexcept;

// Host logger; falls back to a stderr logger when init_logging() was not called
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

} // namespace sniffer::core
