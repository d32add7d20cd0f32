#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <utility>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string claspalt_log_path() {
    static std::string path = (platform::temp_dir() / "claspalt_debug.log").string();
    return path;
}

// Append a timestamped line to the debug log. Never pass credential contents.
inline void claspalt_log(const std::string& msg) {
    std::ofstream out(claspalt_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

template <typename... Args>
inline void claspalt_logf(fmt::format_string<Args...> format, Args&&... args) {
    claspalt_log(fmt::format(format, std::forward<Args>(args)...));
}
