#include "log.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>

namespace {

std::mutex log_mutex;
std::filesystem::path log_path;
bool log_echo = false;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO ";
    }
}

} // namespace

std::filesystem::path volt_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_path.empty()) log_path = platform::temp_dir() / "volt_debug.log";
    return log_path;
}

void set_log_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path = path;
}

void set_log_echo(bool echo) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_echo = echo;
}

void volt_log(LogLevel level, const std::string& msg) {
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
    std::string line = fmt::format("[{}] {} {}\n", ts, level_tag(level), msg);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_path.empty()) log_path = platform::temp_dir() / "volt_debug.log";

    std::ofstream out(log_path, std::ios::app);
    if (out) out << line;
    if (log_echo) std::cerr << line;
}
