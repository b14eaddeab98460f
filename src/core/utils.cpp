#include "utils.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

std::optional<int64_t> parse_int64(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return std::nullopt;
    try {
        size_t idx = 0;
        long long v = std::stoll(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return std::nullopt;
    try {
        size_t idx = 0;
        double v = std::stod(s, &idx);
        if (idx != s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int safe_stoi(const std::string& s, int fallback) {
    auto v = parse_int64(s);
    if (!v || *v < INT32_MIN || *v > INT32_MAX) return fallback;
    return static_cast<int>(*v);
}
