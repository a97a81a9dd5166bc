#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;

std::string& log_path_override() {
    static std::string path;
    return path;
}

} // namespace

std::string chunkpoint_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_path_override().empty()) return log_path_override();
    if (const char* env = std::getenv("CHUNKPOINT_LOG")) {
        if (*env) return env;
    }
    return (platform::temp_dir() / "chunkpoint_debug.log").string();
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path_override() = path;
}

void chunkpoint_log(const std::string& msg) {
    std::string path = chunkpoint_log_path();
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(path, std::ios::app);
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

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

std::filesystem::path job_log_path(const std::filesystem::path& log_dir,
                                   const std::string& job_id) {
    return log_dir / (job_id + ".log");
}

void append_job_log(const std::filesystem::path& log_dir, const std::string& job_id,
                    const std::string& msg) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    std::ofstream f(job_log_path(log_dir, job_id), std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
