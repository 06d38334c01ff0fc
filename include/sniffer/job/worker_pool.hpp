// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace sniffer::job {

// Worker threads executing jobs in FIFO order. A worker is started whenever a
// task would otherwise wait for an idle one, up to max_workers (0: no limit).
// Finished workers stay around for later tasks. submit() never blocks.
class WorkerPool {
public:
    using Task = std::function<void(std::stop_token)>;

    explicit WorkerPool(std::uint32_t max_workers = 0) noexcept;

    // Requests stop on every worker (running tasks see their stop token),
    // drops queued tasks and joins
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. Returns false once shutdown() was called.
    [[nodiscard]] bool submit(Task task);

    // Stop accepting tasks, finish queued and running ones, join
    void shutdown() noexcept;

    [[nodiscard]] std::size_t pending() const noexcept;

    // Workers started so far
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] std::uint32_t max_workers() const noexcept { return max_workers_; }

private:
    void worker_loop(std::stop_token stoken) noexcept;

    const std::uint32_t max_workers_;
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::size_t idle_{0};
    bool stopping_{false};
    std::vector<std::jthread> workers_;
};

} // namespace sniffer::job
