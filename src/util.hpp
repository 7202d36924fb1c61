#pragma once

#include <string>
#include <chrono>

namespace util {
    // e.g. "Mon, 19 Oct 2026 18:55:02 UTC", local time zone
    std::string current_rfc1123();
    std::string html_escape(const std::string& str);
    // 45s, 1m0s, 1h2m3s
    std::string format_duration(std::chrono::seconds d);
}
