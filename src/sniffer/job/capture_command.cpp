// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/job/capture_command.hpp>
#include <algorithm>
#include <iterator>

namespace sniffer::job {

std::string strip_control_chars(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    std::copy_if(value.begin(), value.end(), std::back_inserter(out), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc >= 0x20 && uc != 0x7F;
    });
    return out;
}

std::vector<std::string> build_capture_command(const Job& job, std::string_view tool) {
    std::vector<std::string> args{std::string(tool), "-y"};

    const std::string user_agent = strip_control_chars(job.headers.user_agent);
    const std::string referer = strip_control_chars(job.headers.referer);
    const std::string cookie = strip_control_chars(job.headers.cookie);

    if (!user_agent.empty()) {
        args.emplace_back("-user_agent");
        args.push_back(user_agent);
    }

    // Referer and Cookie travel in a single CRLF-terminated header block
    std::string header_block;
    if (!referer.empty()) {
        header_block += "Referer: " + referer + "\r\n";
    }
    if (!cookie.empty()) {
        header_block += "Cookie: " + cookie + "\r\n";
    }
    if (!header_block.empty()) {
        args.emplace_back("-headers");
        args.push_back(std::move(header_block));
    }

    args.emplace_back("-i");
    args.push_back(job.url);

    // Stream copy, no re-encode
    args.emplace_back("-c");
    args.emplace_back("copy");

    // ADTS to ASC fix-up for AAC from transport streams, no-op otherwise
    args.emplace_back("-bsf:a");
    args.emplace_back("aac_adtstoasc");

    args.push_back(job.output_path.string());
    return args;
}

} // namespace sniffer::job
