// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/job/subprocess.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/core/error.hpp>
#include <sniffer/core/logging.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace sniffer::job {

namespace chrono = std::chrono;

namespace {

std::error_code errno_code(int err) noexcept {
    return {err, std::system_category()};
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// RAII for the posix_spawn attribute objects
struct SpawnSetup {
    posix_spawn_file_actions_t actions{};
    posix_spawnattr_t attr{};
    bool actions_ok{false};
    bool attr_ok{false};

    ~SpawnSetup() {
        if (actions_ok) posix_spawn_file_actions_destroy(&actions);
        if (attr_ok) posix_spawnattr_destroy(&attr);
    }
};

} // namespace

//=============================================================================
// Subprocess
//=============================================================================

std::expected<Subprocess, std::error_code>
Subprocess::spawn(const std::vector<std::string>& argv) noexcept {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(errno_code(ENOENT));
    }

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    if (::pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
        return std::unexpected(errno_code(errno));
    }
    if (::pipe2(err_pipe.data(), O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(errno_code(err));
    }

    auto fail = [&](int err) {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return std::unexpected(errno_code(err));
    };

    SpawnSetup setup;
    if (int rc = posix_spawn_file_actions_init(&setup.actions); rc != 0) {
        return fail(rc);
    }
    setup.actions_ok = true;
    if (int rc = posix_spawnattr_init(&setup.attr); rc != 0) {
        return fail(rc);
    }
    setup.attr_ok = true;

    int rc = posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&setup.actions, out_pipe[1], STDOUT_FILENO);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&setup.actions, err_pipe[1], STDERR_FILENO);
    if (rc != 0) {
        return fail(rc);
    }

    // The host ignores SIGPIPE; the child gets default dispositions back
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t no_signals;
    sigemptyset(&no_signals);
    rc = posix_spawnattr_setsigdefault(&setup.attr, &default_signals);
    if (rc == 0) rc = posix_spawnattr_setsigmask(&setup.attr, &no_signals);

    short flags = POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
#ifdef POSIX_SPAWN_SETSID
    flags |= POSIX_SPAWN_SETSID;
#else
    flags |= POSIX_SPAWN_SETPGROUP;
    if (rc == 0) rc = posix_spawnattr_setpgroup(&setup.attr, 0);
#endif
    if (rc == 0) rc = posix_spawnattr_setflags(&setup.attr, flags);
    if (rc != 0) {
        return fail(rc);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    rc = posix_spawnp(&pid, args[0], &setup.actions, &setup.attr, args.data(), environ);
    if (rc != 0) {
        return fail(rc);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    Subprocess proc;
    proc.pid_ = pid;
    proc.out_fd_ = out_pipe[0];
    proc.err_fd_ = err_pipe[0];
    return proc;
}

Subprocess::~Subprocess() {
    if (running()) {
        terminate();
    }
    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , out_fd_(std::exchange(other.out_fd_, -1))
    , err_fd_(std::exchange(other.err_fd_, -1))
    , status_(other.status_)
    , stderr_(std::move(other.stderr_)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        if (running()) {
            terminate();
        }
        close_pipes();
        pid_ = std::exchange(other.pid_, -1);
        out_fd_ = std::exchange(other.out_fd_, -1);
        err_fd_ = std::exchange(other.err_fd_, -1);
        status_ = other.status_;
        stderr_ = std::move(other.stderr_);
    }
    return *this;
}

std::expected<ProcessResult, std::error_code>
Subprocess::wait(std::stop_token stoken, chrono::seconds timeout) noexcept {
    const bool has_deadline = timeout.count() > 0;
    const auto deadline = chrono::steady_clock::now() + timeout;

    while (running()) {
        if (out_fd_ >= 0 || err_fd_ >= 0) {
            drain(core::POLL_INTERVAL);
        } else {
            std::this_thread::sleep_for(core::POLL_INTERVAL);
        }

        // Reap only once the pipes hit EOF so no trailing output is lost
        if (out_fd_ < 0 && err_fd_ < 0 && try_reap()) {
            break;
        }

        if (stoken.stop_requested()) {
            core::logger()->info("Stopping capture process {}", pid_);
            terminate();
            return std::unexpected(make_error_code(core::HostErrc::cancelled));
        }
        if (has_deadline && chrono::steady_clock::now() >= deadline) {
            core::logger()->warn("Capture process {} timed out after {}s", pid_, timeout.count());
            terminate();
            return std::unexpected(make_error_code(core::HostErrc::timed_out));
        }
    }

    ProcessResult result;
    if (WIFEXITED(status_)) {
        result.exit_code = WEXITSTATUS(status_);
    } else if (WIFSIGNALED(status_)) {
        result.signaled = true;
        result.term_signal = WTERMSIG(status_);
    }
    result.stderr_text = std::move(stderr_);
    stderr_.clear();
    return result;
}

void Subprocess::terminate() noexcept {
    if (!running()) {
        return;
    }

    // Negative pid: the whole process group of the child
    ::kill(-pid_, SIGTERM);

    const auto grace_end = chrono::steady_clock::now() + core::TERMINATE_GRACE;
    while (chrono::steady_clock::now() < grace_end) {
        if (out_fd_ >= 0 || err_fd_ >= 0) {
            drain(chrono::milliseconds{50});
        } else {
            std::this_thread::sleep_for(chrono::milliseconds{50});
        }
        if (try_reap()) {
            close_pipes();
            return;
        }
    }

    ::kill(-pid_, SIGKILL);
    while (::waitpid(pid_, &status_, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
    close_pipes();
}

void Subprocess::drain(chrono::milliseconds timeout) noexcept {
    std::array<pollfd, 2> fds{{
        {out_fd_, POLLIN, 0},
        {err_fd_, POLLIN, 0},
    }};

    // poll() ignores negative descriptors
    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
    if (rc <= 0) {
        return;
    }

    std::array<char, core::PIPE_READ_SIZE> buffer{};
    for (std::size_t i = 0; i < fds.size(); ++i) {
        if (fds[i].fd < 0 || fds[i].revents == 0) {
            continue;
        }

        int& fd = (i == 0) ? out_fd_ : err_fd_;
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            if (i == 1) {
                stderr_.append(buffer.data(), static_cast<std::size_t>(n));
                // Keep a bounded tail
                if (stderr_.size() > 2 * core::STDERR_KEEP_BYTES) {
                    stderr_.erase(0, stderr_.size() - core::STDERR_KEEP_BYTES);
                }
            }
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            close_fd(fd);
        }
    }
}

bool Subprocess::try_reap() noexcept {
    if (pid_ <= 0) {
        return true;
    }

    pid_t rc = ::waitpid(pid_, &status_, WNOHANG);
    if (rc == pid_) {
        pid_ = -1;
        return true;
    }
    if (rc < 0 && errno != EINTR) {
        // ECHILD: reaped elsewhere
        pid_ = -1;
        return true;
    }
    return false;
}

void Subprocess::close_pipes() noexcept {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

} // namespace sniffer::job
