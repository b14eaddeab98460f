#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <sstream>
#include <iomanip>

static bool parse_tm(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return false;

    // Only a fractional-seconds tail may follow
    std::string rest;
    std::getline(ss, rest);
    if (rest.empty()) return true;
    if (rest[0] != '.' || rest.size() == 1) return false;
    for (size_t i = 1; i < rest.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(rest[i]))) return false;
    }
    return true;
}

std::optional<std::time_t> parse_scheduler_time(const std::string& ts) {
    struct tm tm_buf = {};
    if (ts.empty() || !parse_tm(ts, &tm_buf)) return std::nullopt;
    tm_buf.tm_isdst = -1;
    std::time_t t = mktime(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return t;
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    auto start_t = parse_scheduler_time(start_time);
    if (!start_t) return "?";

    std::time_t end_t;
    if (!end_time.empty()) {
        auto parsed = parse_scheduler_time(end_time);
        if (!parsed) return "?";
        end_t = *parsed;
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, *start_t));
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
