#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <clusterlink/core/constants.hpp>
#include <clusterlink/core/types.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/platform/platform.hpp>
#include <fmt/format.h>

namespace clusterlink {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "clusterlink_debug.log").string();
    return path;
}

inline std::string cl_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

// Redirect the debug log (config: logging.file). Empty keeps the current path.
inline void set_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

// Persistent job log path: ~/.clusterlink/logs/{job_id}.log
inline std::string job_log_path(const std::string& job_id) {
    return (platform::app_dir() / "logs" / (job_id + ".log")).string();
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void cl_log(const std::string& msg) {
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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void cl_log_ssh(const std::string& label, const std::string& cmd,
                       const RemoteCommandResult& r) {
    cl_log(fmt::format("{} CMD: {}", label, cmd));
    cl_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                       r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_TRUNCATE)));
    if (!r.stderr_data.empty())
        cl_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_TRUNCATE)));
}

inline void cl_log_error(const std::string& label, const Error& err) {
    cl_log(fmt::format("{} ERROR [{}] {}", label, err.code, err.to_string()));
    if (!err.details.empty())
        cl_log(fmt::format("{} details={}", label, err.details.substr(0, LOG_OUTPUT_TRUNCATE)));
}

} // namespace clusterlink
