// Copyright (c) 2026 changcheng967. All rights reserved.

#include <sniffer/browser/messages.hpp>
#include <sniffer/core/config.hpp>
#include <sniffer/core/error.hpp>

namespace sniffer::browser {

using nlohmann::json;

namespace {

// String member or empty when absent / not a string
std::string string_member(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

Action action_of(const json& message) noexcept {
    if (!message.is_object()) {
        return Action::unknown;
    }

    auto it = message.find("action");
    if (it == message.end() || !it->is_string()) {
        return Action::unknown;
    }

    const auto& action = it->get_ref<const std::string&>();
    if (action == "DOWNLOAD") return Action::download;
    if (action == "PING") return Action::ping;
    return Action::unknown;
}

std::expected<DownloadRequest, std::error_code>
parse_download_request(const json& message) noexcept {
    try {
        DownloadRequest req;

        auto url = message.find("url");
        if (url == message.end() || !url->is_string() || url->get_ref<const std::string&>().empty()) {
            return std::unexpected(make_error_code(core::HostErrc::invalid_request));
        }
        req.url = url->get<std::string>();

        auto filename = message.find("filename");
        if (filename != message.end() && filename->is_string()) {
            req.filename = filename->get<std::string>();
        } else {
            req.filename = core::DEFAULT_FILENAME;
        }

        auto headers = message.find("headers");
        if (headers != message.end() && headers->is_object()) {
            req.headers.user_agent = string_member(*headers, "User-Agent");
            req.headers.referer = string_member(*headers, "Referer");
            req.headers.cookie = string_member(*headers, "Cookie");
        }

        return req;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(core::HostErrc::invalid_request));
    }
}

namespace events {

json starting(const std::filesystem::path& file) {
    return {{"status", "starting"}, {"file", file.string()}};
}

json complete(const std::filesystem::path& file) {
    return {{"status", "complete"}, {"file", file.string()}};
}

json error(std::string_view message) {
    return {{"status", "error"}, {"error", std::string(message)}};
}

json pong() {
    return {{"status", "pong"}};
}

json fatal(std::string_view message) {
    return {{"error", std::string(message)}};
}

} // namespace events

} // namespace sniffer::browser
