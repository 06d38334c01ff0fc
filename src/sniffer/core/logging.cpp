// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/core/logging.hpp>
#include <sniffer/core/error.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <mutex>

namespace sniffer::core {

namespace {

std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> make_stderr_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    return std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
}

} // namespace

std::error_code init_logging(const HostConfig& config) noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    try {
        std::shared_ptr<spdlog::logger> log;
        if (config.log_file.empty()) {
            log = make_stderr_logger();
        } else {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file.string());
            log = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
        }

        log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        log->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        log->flush_on(spdlog::level::info);

        spdlog::drop(LOGGER_NAME);
        spdlog::register_logger(log);
        return {};
    } catch (const spdlog::spdlog_ex&) {
        return make_error_code(HostErrc::invalid_argument);
    }
}

std::shared_ptr<spdlog::logger> logger() noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (auto log = spdlog::get(LOGGER_NAME)) {
        return log;
    }

    auto log = make_stderr_logger();
    log->set_level(spdlog::level::warn);
    try {
        spdlog::register_logger(log);
    } catch (const spdlog::spdlog_ex&) {
        // Registered behind our back; the unregistered logger still works
    }
    return log;
}

} // namespace sniffer::core
