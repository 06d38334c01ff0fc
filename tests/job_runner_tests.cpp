// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <sniffer/job/filename_sanitizer.hpp>
#include <sniffer/job/job_runner.hpp>
#include <sniffer/job/subprocess.hpp>
#include <sniffer/core/error.hpp>
#include "test_support.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

using namespace sniffer::job;
using sniffer::test::TempDir;
using sniffer::test::read_all;
using sniffer::test::write_script;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

struct RunOutput {
    std::vector<json> events;
    JobState state;
};

RunOutput run_job(const fs::path& dir,
                  std::vector<std::string> command,
                  std::chrono::seconds timeout = std::chrono::seconds{0},
                  std::stop_token stoken = {}) {
    std::ostringstream out;
    sniffer::browser::FrameWriter writer(out);

    Job job;
    job.id = 7;
    job.url = "http://x/test.m3u8";
    job.output_path = reserve_output_path(dir, "clip.mp4");

    JobRunner runner(std::move(job), std::move(command), writer, timeout);
    CHECK(runner.state() == JobState::created);
    runner.run(stoken);
    return {read_all(out.str()), runner.state()};
}

} // namespace

TEST_CASE("error_tail", "[runner]") {
    SECTION("Empty stderr") {
        CHECK(error_tail("") == "Unknown FFmpeg error");
    }

    SECTION("Short stderr is kept whole") {
        CHECK(error_tail("Server returned 403 Forbidden\n") == "Server returned 403 Forbidden\n");
    }

    SECTION("Last 200 characters of a long stream") {
        std::string text;
        for (int i = 0; i < 500; ++i) {
            text += static_cast<char>('0' + i % 10);
        }
        CHECK(error_tail(text) == text.substr(300));
    }

    SECTION("Counts characters, not bytes") {
        std::string text;
        for (int i = 0; i < 300; ++i) {
            text += "\xC3\xA9";  // U+00E9
        }
        auto tail = error_tail(text);
        CHECK(tail.size() == 400);
        CHECK(tail == text.substr(200));
    }

    SECTION("Newlines are normalized") {
        CHECK(error_tail("a\r\nb\rc\n") == "a\nb\nc\n");
    }
}

TEST_CASE("Subprocess captures exit status and stderr", "[runner]") {
    auto proc = Subprocess::spawn({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(proc.has_value());

    auto result = proc->wait();
    REQUIRE(result.has_value());
    CHECK_FALSE(result->success());
    CHECK(result->exit_code == 3);
    CHECK(result->stderr_text == "err\n");
    CHECK_FALSE(proc->running());
}

TEST_CASE("Subprocess reports a missing binary", "[runner]") {
    auto proc = Subprocess::spawn({"/nonexistent/sniffer-capture-tool"});
    REQUIRE_FALSE(proc.has_value());
    CHECK(proc.error() == std::errc::no_such_file_or_directory);
}

TEST_CASE("JobRunner success", "[runner]") {
    TempDir dir;
    // Writes to its last argument, like the capture tool
    auto tool = write_script(dir.path() / "fake-ffmpeg",
                             "for a; do last=$a; done\nprintf data > \"$last\"\nexit 0");

    auto out = run_job(dir.path(), {tool.string(), "-y", "-i", "http://x/test.m3u8", (dir.path() / "clip.mp4").string()});

    REQUIRE(out.events.size() == 2);
    CHECK(out.events[0] == json{{"status", "starting"}, {"file", (dir.path() / "clip.mp4").string()}});
    CHECK(out.events[1] == json{{"status", "complete"}, {"file", (dir.path() / "clip.mp4").string()}});
    CHECK(out.state == JobState::completed);
    CHECK(fs::file_size(dir.path() / "clip.mp4") == 4);
}

TEST_CASE("JobRunner tool failure reports the stderr tail", "[runner]") {
    TempDir dir;

    SECTION("500 characters of stderr, exit code 1") {
        auto tool = write_script(dir.path() / "fake-ffmpeg",
                                 "i=0\n"
                                 "while [ $i -lt 500 ]; do printf '%d' $((i % 10)) >&2; i=$((i + 1)); done\n"
                                 "exit 1");
        auto out = run_job(dir.path(), {tool.string()});

        std::string expected;
        for (int i = 300; i < 500; ++i) {
            expected += static_cast<char>('0' + i % 10);
        }

        REQUIRE(out.events.size() == 2);
        CHECK(out.events[0]["status"] == "starting");
        CHECK(out.events[1] == json{{"status", "error"}, {"error", expected}});
        CHECK(out.state == JobState::failed);
        CHECK_FALSE(fs::exists(dir.path() / "clip.mp4"));
    }

    SECTION("Silent failure") {
        auto out = run_job(dir.path(), {"/bin/sh", "-c", "exit 2"});
        REQUIRE(out.events.size() == 2);
        CHECK(out.events[1] == json{{"status", "error"}, {"error", "Unknown FFmpeg error"}});

        // Nothing was written: the name is free for the next attempt
        CHECK_FALSE(fs::exists(dir.path() / "clip.mp4"));
        CHECK(reserve_output_path(dir.path(), "clip.mp4") == dir.path() / "clip.mp4");
    }

    SECTION("Partial output is kept") {
        auto tool = write_script(dir.path() / "fake-ffmpeg",
                                 "for a; do last=$a; done\nprintf partial > \"$last\"\nexit 1");
        auto out = run_job(dir.path(), {tool.string(), (dir.path() / "clip.mp4").string()});
        REQUIRE(out.events.size() == 2);
        CHECK(out.events[1]["status"] == "error");
        CHECK(fs::file_size(dir.path() / "clip.mp4") == 7);
    }

    SECTION("Killed by a signal") {
        auto out = run_job(dir.path(), {"/bin/sh", "-c", "echo dying >&2; kill -9 $$"});
        REQUIRE(out.events.size() == 2);
        CHECK(out.events[1] == json{{"status", "error"}, {"error", "dying\n"}});
        CHECK(out.state == JobState::failed);
    }
}

TEST_CASE("JobRunner launch failure", "[runner]") {
    TempDir dir;
    auto out = run_job(dir.path(), {"/nonexistent/ffmpeg", "-y"});

    REQUIRE(out.events.size() == 2);
    CHECK(out.events[0]["status"] == "starting");
    CHECK(out.events[1]["status"] == "error");
    auto message = out.events[1]["error"].get<std::string>();
    CHECK(message.starts_with("Failed to launch capture tool: "));
    CHECK(out.state == JobState::failed);

    // The reserved placeholder does not outlive a job that never ran
    CHECK_FALSE(fs::exists(dir.path() / "clip.mp4"));
}

TEST_CASE("JobRunner timeout kills a hanging tool", "[runner]") {
    TempDir dir;
    const auto start = std::chrono::steady_clock::now();
    auto out = run_job(dir.path(), {"/bin/sh", "-c", "sleep 30"}, std::chrono::seconds{1});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.events.size() == 2);
    CHECK(out.events[1] == json{{"status", "error"}, {"error", "Capture timed out after 1 seconds"}});
    CHECK(out.state == JobState::failed);
    CHECK(elapsed < std::chrono::seconds{10});
    CHECK_FALSE(fs::exists(dir.path() / "clip.mp4"));
}

TEST_CASE("JobRunner honors stop requests", "[runner]") {
    TempDir dir;
    std::stop_source source;

    std::jthread stopper([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        source.request_stop();
    });

    auto out = run_job(dir.path(), {"/bin/sh", "-c", "sleep 30"}, std::chrono::seconds{0}, source.get_token());

    REQUIRE(out.events.size() == 2);
    CHECK(out.events[1] == json{{"status", "error"}, {"error", "Download cancelled"}});
    CHECK(out.state == JobState::failed);
    CHECK_FALSE(fs::exists(dir.path() / "clip.mp4"));
}
