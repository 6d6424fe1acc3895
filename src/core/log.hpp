#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log lives outside the terminal so it never mixes with remote output.
inline std::string cecssh_log_path() {
    static std::string path = (platform::temp_dir() / "cec-ssh_debug.log").string();
    return path;
}

inline void cecssh_log(const std::string& msg) {
    // Reader, monitor and forwarder threads all log.
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ofstream out(cecssh_log_path(), std::ios::app);
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

// Log a failed best-effort operation. Result is dropped on purpose.
inline void cecssh_log_ignored(const std::string& what, const std::string& error) {
    cecssh_log(fmt::format("{} failed (ignored): {}", what, error));
}
