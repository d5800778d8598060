#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Log directory: ~/.repoxfer/logs unless the config says otherwise.
inline std::filesystem::path& xfer_log_dir() {
    static std::filesystem::path dir = platform::home_dir() / ".repoxfer" / "logs";
    return dir;
}

inline std::mutex& xfer_log_mutex() {
    static std::mutex m;
    return m;
}

inline void set_xfer_log_dir(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lock(xfer_log_mutex());
    xfer_log_dir() = dir;
}

// Persistent job log path: <log dir>/jobs/{job_id}.log
inline std::string job_log_path(const std::string& job_id) {
    return (xfer_log_dir() / "jobs" / (job_id + ".log")).string();
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::string& job_id, const std::string& msg) {
    std::lock_guard<std::mutex> lock(xfer_log_mutex());
    std::string path = job_log_path(job_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void xfer_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(xfer_log_mutex());
    std::error_code ec;
    std::filesystem::create_directories(xfer_log_dir(), ec);
    std::ofstream out(xfer_log_dir() / "repoxfer.log", std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Same line in the global log and the job's own log.
inline void job_event(const std::string& job_id, const std::string& msg) {
    xfer_log(fmt::format("[{}] {}", job_id, msg));
    append_job_log(job_id, msg);
}
