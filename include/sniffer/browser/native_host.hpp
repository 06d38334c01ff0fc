// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/browser/frame_codec.hpp>
#include <sniffer/browser/messages.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/job/worker_pool.hpp>
#include <cstdint>
#include <filesystem>
#include <iosfwd>

namespace sniffer::browser {

// Native messaging host
// Compatible with Chrome and Firefox Native Messaging API
class NativeHost {
public:
    NativeHost(core::HostConfig config, std::istream& in, std::ostream& out);

    NativeHost(const NativeHost&) = delete;
    NativeHost& operator=(const NativeHost&) = delete;

    // Run the native messaging loop until the browser closes the channel or a
    // framing error occurs. In-flight jobs are allowed to finish before it
    // returns. Returns the process exit code.
    [[nodiscard]] int run() noexcept;

    // Route one decoded message. DOWNLOAD returns as soon as the job is queued.
    void process_message(const nlohmann::json& message) noexcept;

    [[nodiscard]] std::uint64_t jobs_submitted() const noexcept { return next_id_ - 1; }

private:
    // Resolve the output path, build the command and hand the job to the pool
    void start_download(const DownloadRequest& request) noexcept;

    // Write a frame originating from the dispatch thread
    void send(const nlohmann::json& event) noexcept;

    core::HostConfig config_;
    std::filesystem::path download_dir_;
    FrameReader reader_;
    FrameWriter writer_;
    std::uint64_t next_id_{1};
    job::WorkerPool pool_;  // Declared last: joins before the writer goes away
};

} // namespace sniffer::browser
