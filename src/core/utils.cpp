#include "utils.hpp"
#include <fmt/format.h>
#include <random>
#include <array>
#include <cctype>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

std::string format_size(std::uint64_t bytes) {
    static const char* UNITS[] = {"b", "kb", "mb", "gb"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    if (unit == 0) return fmt::format("{:.0f}{}", size, UNITS[unit]);
    return fmt::format("{:.1f}{}", size, UNITS[unit]);
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    if (ms < 1000) return fmt::format("{}ms", ms);
    return fmt::format("{:.2f}s", static_cast<double>(ms) / 1000.0);
}

bool is_valid_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string generate_uuid_v4() {
    std::random_device rd;
    std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::array<uint8_t, 16> b;
    for (size_t i = 0; i < b.size(); i += 8) {
        uint64_t v = rng();
        for (size_t j = 0; j < 8; j++) b[i + j] = static_cast<uint8_t>(v >> (j * 8));
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                       b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
}
