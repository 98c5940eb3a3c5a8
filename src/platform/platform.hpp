#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Number of worker threads to use for CPU-bound fan-out (at least 1).
unsigned worker_count();

} // namespace platform
