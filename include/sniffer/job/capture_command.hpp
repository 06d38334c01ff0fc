// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <sniffer/job/job.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sniffer::job {

// Remove CR, LF and other control characters so a value cannot add header lines
[[nodiscard]] std::string strip_control_chars(std::string_view value);

// Argument vector for the capture tool, tool path first:
//   <tool> -y [-user_agent UA] [-headers "Referer: ..\r\nCookie: ..\r\n"]
//          -i <url> -c copy -bsf:a aac_adtstoasc <output>
// The URL is passed through unchecked.
[[nodiscard]] std::vector<std::string> build_capture_command(const Job& job, std::string_view tool);

} // namespace sniffer::job
