#include "health-monitor/process_inspector.h"

#include <array>
#include <charconv>

namespace hmon {

namespace {

bool parse_component(std::string_view token, int64_t& out) {
    if (token.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{} && ptr == token.data() + token.size() && out >= 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

int64_t parse_elapsed_time(std::string_view etime) {
    etime = trim(etime);

    int64_t days = 0;
    auto dash = etime.find('-');
    if (dash != std::string_view::npos) {
        if (!parse_component(etime.substr(0, dash), days)) {
            return 0;
        }
        etime.remove_prefix(dash + 1);
    }

    std::array<int64_t, 3> parts{};
    size_t count = 0;
    while (true) {
        auto colon = etime.find(':');
        std::string_view token = etime.substr(0, colon);
        if (count == parts.size() || !parse_component(token, parts[count])) {
            return 0;
        }
        ++count;
        if (colon == std::string_view::npos) {
            break;
        }
        etime.remove_prefix(colon + 1);
    }

    if (count == 2 && dash == std::string_view::npos) {
        return parts[0] * 60 + parts[1];
    }
    if (count == 3) {
        return days * 86400 + parts[0] * 3600 + parts[1] * 60 + parts[2];
    }
    return 0;
}

} // namespace hmon
