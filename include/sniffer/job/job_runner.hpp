// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/browser/frame_codec.hpp>
#include <sniffer/job/job.hpp>
#include <atomic>
#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sniffer::job {

// Error text reported for a failed tool run: the last 200 characters of its
// error stream (newlines normalized to '\n'), or "Unknown FFmpeg error".
[[nodiscard]] std::string error_tail(std::string_view stderr_text);

// Supervises one job: reports "starting", runs the capture tool to
// completion and reports "complete" or "error". Never throws; every failure
// ends up as an error frame for this job only.
class JobRunner {
public:
    JobRunner(Job job,
              std::vector<std::string> command,
              browser::FrameWriter& writer,
              std::chrono::seconds timeout = std::chrono::seconds{0}) noexcept;

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // Run the job to its terminal state. Blocks until the tool exits.
    void run(std::stop_token stoken = {}) noexcept;

    [[nodiscard]] JobState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const Job& job() const noexcept { return job_; }

private:
    void fail(std::string_view message) noexcept;
    void send(const nlohmann::json& event) noexcept;

    Job job_;
    std::vector<std::string> command_;
    browser::FrameWriter& writer_;
    std::chrono::seconds timeout_;
    std::atomic<JobState> state_{JobState::created};
};

} // namespace sniffer::job
