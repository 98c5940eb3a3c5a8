#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Human-readable byte count: "512b", "1.5kb", "12.0mb", "2.3gb".
std::string format_size(std::uint64_t bytes);

// Elapsed time: "840ms" below one second, "3.27s" above.
std::string format_duration(std::chrono::steady_clock::duration d);

// True for the canonical 8-4-4-4-12 hex form (either case).
bool is_valid_uuid(const std::string& s);

// Random (version 4) UUID in lowercase canonical form.
std::string generate_uuid_v4();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
