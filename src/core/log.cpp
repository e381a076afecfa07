#include "log.hpp"
#include <platform/platform.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "hostshell_debug.log").string();
    return path;
}

std::atomic<bool> log_enabled{true};

} // namespace

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void set_log_enabled(bool enabled) {
    log_enabled = enabled;
}

void hostshell_log(const std::string& msg) {
    if (!log_enabled) return;

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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
