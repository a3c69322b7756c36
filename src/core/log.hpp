#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>

inline std::string hpcsync_log_path() {
    static std::string path = (platform::temp_dir() / "hpcsync_debug.log").string();
    return path;
}

inline void hpcsync_log(const std::string& msg) {
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);

    std::ofstream out(hpcsync_log_path(), std::ios::app);
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

// Record a finished command. Never pass spec.stdin_data or env values here:
// describe() renders program + args only.
inline void hpcsync_log_cmd(const std::string& label, const platform::ProcessSpec& spec,
                            const platform::ProcessResult& r) {
    hpcsync_log(fmt::format("{} CMD: {}", label, platform::describe(spec)));
    hpcsync_log(fmt::format("{} exit={}{} stdout({})={}", label, r.exit_code,
                            r.timed_out ? " (timeout)" : "",
                            r.stdout_data.size(),
                            r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW)));
    if (!r.stderr_data.empty())
        hpcsync_log(fmt::format("{} stderr={}", label,
                                r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW)));
}
