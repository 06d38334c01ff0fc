// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sniffer::job {

// Keep letters, digits, space, '.', '_' and '-'; strip trailing whitespace.
// Never returns an empty name: falls back to "video.mp4".
[[nodiscard]] std::string sanitize_filename(std::string_view raw);

// ~/Downloads of the current user
[[nodiscard]] std::filesystem::path default_download_dir();

// Sanitize raw_filename and claim a path under dir that did not exist yet,
// appending _1, _2, ... before the extension when taken. The path is claimed
// by creating an empty placeholder with O_EXCL, so concurrent callers never
// get the same path. When the directory does not allow creating files the
// plain existence check is used instead (the capture tool reports the failure).
[[nodiscard]] std::filesystem::path reserve_output_path(const std::filesystem::path& dir,
                                                        std::string_view raw_filename) noexcept;

// Remove a placeholder left by reserve_output_path() if nothing was written to it
void release_output_path(const std::filesystem::path& path) noexcept;

} // namespace sniffer::job
