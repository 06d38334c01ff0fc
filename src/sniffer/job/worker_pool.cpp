// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/job/worker_pool.hpp>
#include <sniffer/core/logging.hpp>
#include <exception>
#include <system_error>

namespace sniffer::job {

WorkerPool::WorkerPool(std::uint32_t max_workers) noexcept
    : max_workers_(max_workers) {}

WorkerPool::~WorkerPool() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        tasks_.clear();
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.request_stop();
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));

        // Every queued task needs a waiting worker, unless the cap is reached
        const bool below_cap = max_workers_ == 0 || workers_.size() < max_workers_;
        if (idle_ < tasks_.size() && below_cap) {
            try {
                workers_.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
            } catch (const std::system_error& e) {
                core::logger()->warn("Cannot start worker thread: {}", e.what());
                if (workers_.empty()) {
                    tasks_.pop_back();
                    return false;
                }
                // Queued until a running worker frees up
            }
        }
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() noexcept {
    std::vector<std::jthread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t WorkerPool::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void WorkerPool::worker_loop(std::stop_token stoken) noexcept {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++idle_;
            cv_.wait(lock, stoken, [this] { return stopping_ || !tasks_.empty(); });
            --idle_;

            if (stoken.stop_requested() || tasks_.empty()) {
                return;  // Torn down, or shut down and drained
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task(stoken);
        } catch (const std::exception& e) {
            core::logger()->error("Worker task failed: {}", e.what());
        }
    }
}

} // namespace sniffer::job
