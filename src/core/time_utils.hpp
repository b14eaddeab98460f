#pragma once

#include <string>
#include <optional>
#include <ctime>

// Parse a Grid Engine timestamp (YYYY-MM-DDTHH:MM:SS, optionally followed
// by fractional seconds such as ".123") as local time.
// Returns nullopt on anything else.
std::optional<std::time_t> parse_scheduler_time(const std::string& ts);

// Format the duration between two scheduler timestamps.
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");
