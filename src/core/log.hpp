#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Info, Warn, Error };

// Debug log file. Defaults to <tmp>/volt_debug.log until set_log_path() is called.
std::filesystem::path volt_log_path();
void set_log_path(const std::filesystem::path& path);

// Also write every line to stderr (the server does, the client does not).
void set_log_echo(bool echo);

// Append a timestamped line. Safe to call from any thread.
void volt_log(LogLevel level, const std::string& msg);

inline void volt_log(const std::string& msg) {
    volt_log(LogLevel::Info, msg);
}

template <typename... Args>
inline void volt_logf(LogLevel level, fmt::format_string<Args...> f, Args&&... args) {
    volt_log(level, fmt::format(f, std::forward<Args>(args)...));
}
