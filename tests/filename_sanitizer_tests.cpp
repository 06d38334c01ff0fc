// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <sniffer/job/filename_sanitizer.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdlib.h>

using namespace sniffer::job;
namespace fs = std::filesystem;

TEST_CASE("sanitize_filename", "[sanitizer]") {
    SECTION("Disallowed characters are dropped") {
        CHECK(sanitize_filename("My Video!!.mp4") == "My Video.mp4");
        CHECK(sanitize_filename("a/b\\c:d*e?f\"g<h>i|j.ts") == "abcdefghij.ts");
        CHECK(sanitize_filename("../../etc/passwd") == "....etcpasswd");
        CHECK(sanitize_filename("new\r\nline\t.mp4") == "newline.mp4");
    }

    SECTION("Allowed set is kept") {
        CHECK(sanitize_filename("clip_01-final.v2.mp4") == "clip_01-final.v2.mp4");
    }

    SECTION("Trailing whitespace is stripped") {
        CHECK(sanitize_filename("name.mp4   ") == "name.mp4");
        CHECK(sanitize_filename("name !!") == "name");
    }

    SECTION("Empty result falls back to default") {
        CHECK(sanitize_filename("") == "video.mp4");
        CHECK(sanitize_filename("!!!") == "video.mp4");
        CHECK(sanitize_filename("   ") == "video.mp4");
        CHECK(sanitize_filename("..") == "video.mp4");
        CHECK(sanitize_filename("/") == "video.mp4");
    }

    SECTION("Non-ASCII letters are kept, symbols are not") {
        CHECK(sanitize_filename("Vidéo d'été.mp4") == "Vidéo dété.mp4");
        CHECK(sanitize_filename("日本語の動画.mp4") == "日本語の動画.mp4");
        CHECK(sanitize_filename("clip\xE2\x80\x94 \xF0\x9F\x8E\xAC.mp4") == "clip .mp4");
        CHECK(sanitize_filename("bad\xff\xfe.mp4") == "bad.mp4");
    }

    SECTION("Result only ever contains the permitted set") {
        const std::string hostile = "<script>alert(1)</script>;rm -rf ~ && $(id)`x`|%00.mp4";
        auto safe = sanitize_filename(hostile);
        CHECK_FALSE(safe.empty());
        CHECK(std::all_of(safe.begin(), safe.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == ' ' || c == '.' || c == '_' || c == '-';
        }));
    }
}

TEST_CASE("reserve_output_path", "[sanitizer]") {
    sniffer::test::TempDir dir;

    SECTION("Free path is used as is") {
        auto path = reserve_output_path(dir.path(), "My Video!!.mp4");
        CHECK(path == dir.path() / "My Video.mp4");
        CHECK(path.is_absolute());
        CHECK(fs::exists(path));  // Placeholder claimed
    }

    SECTION("Occupied path gets a numeric suffix") {
        std::ofstream(dir.path() / "My Video.mp4") << "data";
        auto path = reserve_output_path(dir.path(), "My Video.mp4");
        CHECK(path == dir.path() / "My Video_1.mp4");

        std::ofstream(dir.path() / "My Video_2.mp4") << "data";
        auto next = reserve_output_path(dir.path(), "My Video.mp4");
        CHECK(next == dir.path() / "My Video_3.mp4");
    }

    SECTION("Suffix goes before the last extension only") {
        std::ofstream(dir.path() / "archive.tar.gz") << "data";
        CHECK(reserve_output_path(dir.path(), "archive.tar.gz") == dir.path() / "archive.tar_1.gz");

        std::ofstream(dir.path() / "noext") << "data";
        CHECK(reserve_output_path(dir.path(), "noext") == dir.path() / "noext_1");
    }

    SECTION("Leading dots are part of the stem") {
        std::ofstream(dir.path() / "..a") << "data";
        CHECK(reserve_output_path(dir.path(), "..a") == dir.path() / "..a_1");

        std::ofstream(dir.path() / ".hidden") << "data";
        CHECK(reserve_output_path(dir.path(), ".hidden") == dir.path() / ".hidden_1");

        std::ofstream(dir.path() / "..clip.mp4") << "data";
        CHECK(reserve_output_path(dir.path(), "..clip.mp4") == dir.path() / "..clip_1.mp4");
    }

    SECTION("Repeated requests for one name yield distinct paths") {
        std::set<fs::path> paths;
        for (int i = 0; i < 25; ++i) {
            paths.insert(reserve_output_path(dir.path(), "same.mp4"));
        }
        CHECK(paths.size() == 25);
    }

    SECTION("Missing directory is created") {
        auto nested = dir.path() / "a" / "b";
        auto path = reserve_output_path(nested, "x.mp4");
        CHECK(path == nested / "x.mp4");
        CHECK(fs::is_directory(nested));
    }

    SECTION("release_output_path removes only empty placeholders") {
        auto empty = reserve_output_path(dir.path(), "empty.mp4");
        release_output_path(empty);
        CHECK_FALSE(fs::exists(empty));

        auto written = reserve_output_path(dir.path(), "written.mp4");
        std::ofstream(written) << "payload";
        release_output_path(written);
        CHECK(fs::exists(written));

        REQUIRE_NOTHROW(release_output_path(dir.path() / "missing.mp4"));
    }
}

TEST_CASE("default_download_dir", "[sanitizer]") {
    const char* old_home = std::getenv("HOME");
    const std::string saved = old_home ? old_home : "";

    ::setenv("HOME", "/home/tester", 1);
    CHECK(default_download_dir() == fs::path("/home/tester/Downloads"));

    if (old_home) {
        ::setenv("HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }
}
