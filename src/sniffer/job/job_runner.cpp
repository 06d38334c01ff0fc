// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/job/job_runner.hpp>
#include <sniffer/browser/messages.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/core/error.hpp>
#include <sniffer/core/logging.hpp>
#include <sniffer/job/filename_sanitizer.hpp>
#include <sniffer/job/subprocess.hpp>
#include <format>
#include <utility>

namespace sniffer::job {

namespace {

// "\r\n" and lone "\r" become "\n", as a text-mode read of the stream would
std::string normalize_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

} // namespace

std::string error_tail(std::string_view stderr_text) {
    if (stderr_text.empty()) {
        return std::string(core::UNKNOWN_TOOL_ERROR);
    }

    const std::string text = normalize_newlines(stderr_text);

    // Walk back ERROR_TAIL_CHARS code points (continuation bytes don't count)
    std::size_t start = text.size();
    std::size_t chars = 0;
    while (start > 0 && chars < core::ERROR_TAIL_CHARS) {
        --start;
        if ((static_cast<unsigned char>(text[start]) & 0xC0) != 0x80) {
            ++chars;
        }
    }
    return text.substr(start);
}

//=============================================================================
// JobRunner
//=============================================================================

JobRunner::JobRunner(Job job,
                     std::vector<std::string> command,
                     browser::FrameWriter& writer,
                     std::chrono::seconds timeout) noexcept
    : job_(std::move(job))
    , command_(std::move(command))
    , writer_(writer)
    , timeout_(timeout) {}

void JobRunner::run(std::stop_token stoken) noexcept {
    auto log = core::logger();

    state_.store(JobState::started, std::memory_order_release);
    send(browser::events::starting(job_.output_path));
    log->info("Job {}: capturing {} -> {}", job_.id, job_.url, job_.output_path.string());

    auto process = Subprocess::spawn(command_);
    if (!process) {
        fail(std::format("{}: {}", core::make_error_code(core::HostErrc::launch_failed).message(),
                         process.error().message()));
        return;
    }

    auto result = process->wait(stoken, timeout_);
    if (!result) {
        if (result.error() == core::HostErrc::timed_out) {
            fail(std::format("Capture timed out after {} seconds", timeout_.count()));
        } else {
            fail(result.error().message());
        }
        return;
    }

    if (result->success()) {
        state_.store(JobState::completed, std::memory_order_release);
        send(browser::events::complete(job_.output_path));
        log->info("Job {}: complete", job_.id);
        return;
    }

    if (result->signaled) {
        log->warn("Job {}: capture tool killed by signal {}", job_.id, result->term_signal);
    } else {
        log->warn("Job {}: capture tool exited with code {}", job_.id, result->exit_code);
    }
    fail(error_tail(result->stderr_text));
}

void JobRunner::fail(std::string_view message) noexcept {
    // An empty placeholder would push the next attempt at this name to a suffix
    release_output_path(job_.output_path);
    state_.store(JobState::failed, std::memory_order_release);
    core::logger()->error("Job {}: {}", job_.id, message);
    send(browser::events::error(message));
}

void JobRunner::send(const nlohmann::json& event) noexcept {
    if (auto ec = writer_.write(event)) {
        core::logger()->error("Job {}: failed to report status: {}", job_.id, ec.message());
    }
}

} // namespace sniffer::job
