#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

static fs::path& log_dir_ref() {
    static fs::path dir = platform::temp_dir() / "coldxfer";
    return dir;
}

void set_log_dir(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_dir_ref() = dir;
}

fs::path log_dir() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_dir_ref();
}

static void write_debug_line(const fs::path& dir, const std::string& msg) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::ofstream out(dir / "coldxfer_debug.log", std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);

    out << fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void coldxfer_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    write_debug_line(log_dir_ref(), msg);
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    fs::path jobs_dir = log_dir_ref() / "jobs";
    std::error_code ec;
    fs::create_directories(jobs_dir, ec);
    std::ofstream f(jobs_dir / (job_id + ".log"), std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
    write_debug_line(log_dir_ref(), job_id + ": " + msg);
}
