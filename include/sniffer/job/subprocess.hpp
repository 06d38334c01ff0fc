// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>
#include <sys/types.h>

namespace sniffer::job {

// Outcome of a finished child process
struct ProcessResult {
    int exit_code{-1};
    int term_signal{0};
    bool signaled{false};
    std::string stderr_text;  // Tail of the error stream (bounded)

    [[nodiscard]] bool success() const noexcept { return !signaled && exit_code == 0; }
};

// Child process with captured stdout/stderr. The child runs in its own
// session (no controlling terminal) with stdin on /dev/null.
class Subprocess {
public:
    // Launch argv[0], searched in PATH. Errors carry the errno of the failed
    // spawn/exec (system_category).
    [[nodiscard]] static std::expected<Subprocess, std::error_code>
    spawn(const std::vector<std::string>& argv) noexcept;

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;

    // Collect output until the child exits. With a non-zero timeout, or when
    // stop is requested, the child is terminated and timed_out / cancelled
    // is returned.
    [[nodiscard]] std::expected<ProcessResult, std::error_code>
    wait(std::stop_token stoken = {}, std::chrono::seconds timeout = std::chrono::seconds{0}) noexcept;

    // SIGTERM the process group, SIGKILL after a grace period, reap
    void terminate() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

private:
    Subprocess() = default;

    // Read whatever is available on the pipes, waiting at most `timeout`
    void drain(std::chrono::milliseconds timeout) noexcept;

    // Non-blocking reap; true once the child is gone
    bool try_reap() noexcept;

    void close_pipes() noexcept;

    pid_t pid_{-1};
    int out_fd_{-1};
    int err_fd_{-1};
    int status_{0};
    std::string stderr_;
};

} // namespace sniffer::job
