#pragma once

#include <string>
#include <vector>
#include <variant>
#include <filesystem>

namespace fingerprint {

// Exact tree hash of each directory, combined when there are several.
struct ExactPlan {
    std::vector<std::string> dirs;
};

// One sampling hash over the union of every directory's files.
struct SamplingPlan {
    std::vector<std::string> dirs;
};

using Plan = std::variant<ExactPlan, SamplingPlan>;

// Picks the strategy once per call, by total regular file count:
// up to EXACT_HASH_MAX_FILES files are tree-hashed, beyond that sampled.
Plan choose_plan(const std::filesystem::path& root, const std::vector<std::string>& dirs);

// Fingerprint of a set of directories, relative to root.
//
// Order of `dirs` does not matter. An empty list, or a single directory that
// does not exist, yields SENTINEL_FINGERPRINT. Never throws: unreadable
// content degrades the result instead of failing the caller.
std::string compute_fingerprint(const std::vector<std::string>& dirs,
                                const std::filesystem::path& root = std::filesystem::current_path());

// Runs an already chosen plan.
std::string run_plan(const Plan& plan, const std::filesystem::path& root);

// Merge several hex hashes into one 64-char token. For each of 4 rounds r,
// XOR together (first 16 hex chars parsed as u64) + r over all hashes, and
// print the round as 16 hex chars. Input should already be sorted.
std::string combine_hashes(const std::vector<std::string>& sorted_hashes);

} // namespace fingerprint
