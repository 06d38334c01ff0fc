// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/job/filename_sanitizer.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/core/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace sniffer::job {

namespace {

enum class Claim {
    claimed,
    exists,
    unavailable
};

// Decode one UTF-8 sequence starting at s[pos]. Returns its length, 0 if malformed.
std::size_t decode_utf8(std::string_view s, std::size_t pos, char32_t& cp) noexcept {
    const auto lead = static_cast<unsigned char>(s[pos]);

    std::size_t len = 0;
    char32_t min = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2; min = 0x80; cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3; min = 0x800; cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4; min = 0x10000; cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + len > s.size()) {
        return 0;
    }

    for (std::size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<unsigned char>(s[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

// Non-ASCII letter or digit, approximated by excluding the symbol blocks
bool is_wide_letter(char32_t cp) noexcept {
    if (cp < 0xC0) return false;                        // Latin-1 punctuation, NBSP
    if (cp == 0xD7 || cp == 0xF7) return false;         // multiplication / division signs
    if (cp >= 0x2000 && cp <= 0x2BFF) return false;     // punctuation, arrows, math, box drawing
    if (cp >= 0x3000 && cp <= 0x303F) return false;     // CJK punctuation, ideographic space
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;     // private use
    if (cp >= 0xFE00 && cp <= 0xFE6F) return false;     // variation selectors, compatibility forms
    if (cp >= 0xFF00 && cp <= 0xFF0F) return false;     // fullwidth punctuation
    if (cp >= 0xFFF0 && cp <= 0xFFFF) return false;     // specials
    if (cp >= 0x1F000 && cp <= 0x1FAFF) return false;   // emoji, pictographs
    if (cp >= 0xE0000) return false;                    // tags, supplementary private use
    return true;
}

bool is_allowed_ascii(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == ' ' || c == '.' || c == '_' || c == '-';
}

Claim try_claim(const fs::path& path) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
        ::close(fd);
        return Claim::claimed;
    }
    return errno == EEXIST ? Claim::exists : Claim::unavailable;
}

fs::path home_dir() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }

    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size > 0 ? static_cast<std::size_t>(size) : 16384);
    passwd pw{};
    passwd* result = nullptr;
    if (::getpwuid_r(::getuid(), &pw, buffer.data(), buffer.size(), &result) == 0
        && result != nullptr && result->pw_dir != nullptr) {
        return result->pw_dir;
    }

    std::error_code ec;
    return fs::current_path(ec);
}

} // namespace

std::string sanitize_filename(std::string_view raw) {
    std::string safe;
    safe.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size();) {
        const auto uc = static_cast<unsigned char>(raw[i]);
        if (uc < 0x80) {
            if (is_allowed_ascii(raw[i])) {
                safe += raw[i];
            }
            ++i;
            continue;
        }

        char32_t cp = 0;
        std::size_t len = decode_utf8(raw, i, cp);
        if (len == 0) {
            ++i;  // Drop stray byte
            continue;
        }
        if (is_wide_letter(cp)) {
            safe.append(raw.substr(i, len));
        }
        i += len;
    }

    // Strip trailing whitespace
    while (!safe.empty() && safe.back() == ' ') {
        safe.pop_back();
    }

    // "", "." and ".." would name the directory itself
    if (std::all_of(safe.begin(), safe.end(), [](char c) { return c == '.'; })) {
        return std::string(core::DEFAULT_FILENAME);
    }

    return safe;
}

fs::path default_download_dir() {
    return home_dir() / "Downloads";
}

fs::path reserve_output_path(const fs::path& dir, std::string_view raw_filename) noexcept {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        core::logger()->warn("Cannot create download directory {}: {}", dir.string(), ec.message());
    }

    fs::path base_dir = fs::absolute(dir, ec);
    if (ec) {
        base_dir = dir;
    }

    const std::string name = sanitize_filename(raw_filename);
    const fs::path first = base_dir / name;

    // Leading dots belong to the stem: ".hidden" and "..a" have no extension
    std::string stem = name;
    std::string ext;
    const auto body = name.find_first_not_of('.');
    if (const auto dot = name.rfind('.'); body != std::string::npos && dot != std::string::npos && dot > body) {
        stem = name.substr(0, dot);
        ext = name.substr(dot);
    }

    for (std::uint64_t counter = 0;; ++counter) {
        fs::path candidate = counter == 0
            ? first
            : base_dir / (stem + "_" + std::to_string(counter) + ext);

        switch (try_claim(candidate)) {
            case Claim::claimed:
                return candidate;
            case Claim::exists:
                break;
            case Claim::unavailable:
                // Check-then-use: racy against other writers, the tool reports failures
                if (!fs::exists(candidate, ec)) {
                    return candidate;
                }
                break;
        }
    }
}

void release_output_path(const fs::path& path) noexcept {
    std::error_code ec;
    if (fs::is_regular_file(path, ec) && fs::file_size(path, ec) == 0 && !ec) {
        fs::remove(path, ec);
    }
}

} // namespace sniffer::job
