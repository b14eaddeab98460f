#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Strict base-10 int64 parse: the whole string must be consumed.
// Returns nullopt on empty input, stray characters, or overflow.
std::optional<int64_t> parse_int64(const std::string& s);

// Strict double parse with the same whole-string rule. nan and inf are
// rejected.
std::optional<double> parse_double(const std::string& s);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
