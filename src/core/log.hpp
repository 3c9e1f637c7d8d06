#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string jobrunner_log_path() {
    static std::string path = (platform::temp_dir() / "jobrunner_debug.log").string();
    return path;
}

// Per-job log: <job output dir>/jobrunner.log. Reruns reuse the job_id, so
// every submission attempt for a job lands in the same file.
inline std::string job_log_path(const std::filesystem::path& job_dir) {
    return (job_dir / JOB_LOG_FILENAME).string();
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::filesystem::path& job_dir, const std::string& msg) {
    std::error_code ec;
    std::filesystem::create_directories(job_dir, ec);
    std::ofstream f(job_log_path(job_dir), std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void jobrunner_log(const std::string& msg) {
    std::ofstream out(jobrunner_log_path(), std::ios::app);
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

inline void jobrunner_log_command(const std::string& label, const std::string& cmd,
                                  const CommandResult& r) {
    jobrunner_log(fmt::format("{} CMD: {}", label, cmd));
    jobrunner_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                              r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        jobrunner_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
