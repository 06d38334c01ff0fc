// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/browser/native_host.hpp>
#include <sniffer/core/error.hpp>
#include <sniffer/core/logging.hpp>
#include <sniffer/job/capture_command.hpp>
#include <sniffer/job/filename_sanitizer.hpp>
#include <sniffer/job/job_runner.hpp>
#include <expected>
#include <memory>
#include <utility>

namespace sniffer::browser {

using nlohmann::json;

//=============================================================================
// NativeHost
//=============================================================================

NativeHost::NativeHost(core::HostConfig config, std::istream& in, std::ostream& out)
    : config_(std::move(config))
    , download_dir_(config_.download_dir.empty() ? job::default_download_dir() : config_.download_dir)
    , reader_(in)
    , writer_(out)
    , pool_(config_.max_jobs) {}

int NativeHost::run() noexcept {
    auto log = core::logger();
    if (pool_.max_workers() == 0) {
        log->info("Native host started: downloads to {}", download_dir_.string());
    } else {
        log->info("Native host started: at most {} captures, downloads to {}",
                  pool_.max_workers(), download_dir_.string());
    }

    int exit_code = 0;

    // Main message loop
    while (true) {
        auto message = reader_.read();
        if (message && message->has_value() && !(*message)->is_object()) {
            log->debug("Payload is not an object");
            message = std::unexpected(make_error_code(core::HostErrc::malformed_payload));
        }

        if (!message) {
            const auto ec = message.error();
            log->error("Read failed: {}", ec.message());
            // Channel state is unknown after a framing error: report once and stop
            if (core::is_protocol_error(ec)) {
                send(events::fatal(ec.message()));
            }
            exit_code = 1;
            break;
        }

        if (!message->has_value()) {
            log->info("Channel closed by browser");
            break;  // EOF
        }

        process_message(**message);
    }

    if (auto pending = pool_.pending(); pending > 0) {
        log->info("Waiting for {} queued downloads", pending);
    }
    pool_.shutdown();

    log->info("Native host exiting with code {}", exit_code);
    return exit_code;
}

void NativeHost::process_message(const json& message) noexcept {
    switch (action_of(message)) {
        case Action::download: {
            auto request = parse_download_request(message);
            if (!request) {
                core::logger()->warn("Rejected DOWNLOAD: {}", request.error().message());
                send(events::error(request.error().message()));
                return;
            }
            start_download(*request);
            break;
        }
        case Action::ping:
            send(events::pong());
            break;
        case Action::unknown:
            core::logger()->debug("Ignoring message: {}",
                                  message.dump(-1, ' ', false, json::error_handler_t::replace));
            break;
    }
}

void NativeHost::start_download(const DownloadRequest& request) noexcept {
    job::Job job;
    job.id = next_id_++;
    job.url = request.url;
    job.headers = request.headers;
    job.output_path = job::reserve_output_path(download_dir_, request.filename);

    auto command = job::build_capture_command(job, config_.capture_tool);
    auto runner = std::make_shared<job::JobRunner>(std::move(job), std::move(command), writer_,
                                                   config_.job_timeout);

    if (!pool_.submit([runner](std::stop_token stoken) { runner->run(stoken); })) {
        core::logger()->error("Job {}: worker pool is shut down", runner->job().id);
        job::release_output_path(runner->job().output_path);
        send(events::error(make_error_code(core::HostErrc::cancelled).message()));
    }
}

void NativeHost::send(const json& event) noexcept {
    if (auto ec = writer_.write(event)) {
        core::logger()->error("Failed to send message: {}", ec.message());
    }
}

} // namespace sniffer::browser
