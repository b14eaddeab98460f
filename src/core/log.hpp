#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log location. Defaults to <temp>/gestat_debug.log; config `log_path`
// replaces it for the rest of the process.
inline std::string& gestat_log_path() {
    static std::string path = (platform::temp_dir() / "gestat_debug.log").string();
    return path;
}

inline void set_gestat_log_path(const std::string& path) {
    if (!path.empty()) gestat_log_path() = path;
}

inline void gestat_log(const std::string& msg) {
    std::ofstream out(gestat_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}
