#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string YELLOW    = "\033[38;2;240;190;50m";
    const std::string CYAN      = "\033[38;2;80;170;200m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::YELLOW + color::BOLD + "  volt" + color::RESET
         + color::DIM + " " + VOLT_VERSION + "  build cache sync" + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::YELLOW + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::CYAN + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::YELLOW + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// Usage row: command, argument hint, description
inline std::string usage(const std::string& cmd, const std::string& arg, const std::string& desc) {
    std::string left = cmd + (arg.empty() ? "" : " " + arg);
    return color::CYAN + "    " + cmd + color::RESET
         + (arg.empty() ? "" : " " + yellow(arg))
         + color::DIM + fmt::format("{:<{}}", "", left.size() < 24 ? 24 - left.size() : 1)
         + desc + color::RESET + "\n";
}

} // namespace theme
