#include "util.hpp"
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace util {

std::string current_rfc1123() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&itt, &local);
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&local, "%a, %d %b %Y %H:%M:%S %Z");
    return ss.str();
}

std::string html_escape(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string format_duration(std::chrono::seconds d) {
    auto total = d.count();
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::string out;
    if (hours > 0) out += std::to_string(hours) + "h";
    if (hours > 0 || minutes > 0) out += std::to_string(minutes) + "m";
    out += std::to_string(seconds) + "s";
    return out;
}

} // namespace util
