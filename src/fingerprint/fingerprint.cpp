#include "fingerprint.hpp"
#include "tree_hash.hpp"
#include "sampling_hash.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace fs = std::filesystem;

namespace fingerprint {

// Normalize and dedupe so that {"a", "./a", "a/"} and any permutation of the
// list describe the same input.
static std::vector<std::string> normalize_dirs(const std::vector<std::string>& dirs) {
    std::vector<std::string> out;
    out.reserve(dirs.size());
    for (const auto& d : dirs) {
        auto norm = fs::path(d).lexically_normal().generic_string();
        while (norm.size() > 1 && norm.back() == '/') norm.pop_back();
        out.push_back(norm);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Plan choose_plan(const fs::path& root, const std::vector<std::string>& dirs) {
    if (count_regular_files(root, dirs) <= EXACT_HASH_MAX_FILES) {
        return ExactPlan{dirs};
    }
    return SamplingPlan{dirs};
}

static std::string exact_or_fallback(const fs::path& root, const std::string& dir) {
    std::error_code ec;
    if (!fs::exists(root / dir, ec)) return SENTINEL_FINGERPRINT;

    auto exact = exact_tree_hash(root / dir);
    if (exact) return *exact;
    return sampling_hash(root, {dir});
}

std::string combine_hashes(const std::vector<std::string>& sorted_hashes) {
    std::string out;
    out.reserve(COMBINE_ROUNDS * 16);

    for (int round = 0; round < COMBINE_ROUNDS; round++) {
        std::uint64_t acc = 0;
        for (const auto& h : sorted_hashes) {
            std::string head = h.substr(0, 16);
            std::uint64_t value = std::strtoull(head.c_str(), nullptr, 16);
            acc ^= value + static_cast<std::uint64_t>(round);
        }
        out += fmt::format("{:016x}", acc);
    }
    return out;
}

std::string run_plan(const Plan& plan, const fs::path& root) {
    struct Runner {
        const fs::path& root;

        std::string operator()(const ExactPlan& p) const {
            if (p.dirs.size() == 1) return exact_or_fallback(root, p.dirs[0]);

            std::vector<std::string> hashes;
            hashes.reserve(p.dirs.size());
            for (const auto& d : p.dirs) hashes.push_back(exact_or_fallback(root, d));
            std::sort(hashes.begin(), hashes.end());
            return combine_hashes(hashes);
        }

        std::string operator()(const SamplingPlan& p) const {
            return sampling_hash(root, p.dirs);
        }
    };

    return std::visit(Runner{root}, plan);
}

std::string compute_fingerprint(const std::vector<std::string>& dirs, const fs::path& root) {
    auto normalized = normalize_dirs(dirs);
    if (normalized.empty()) return SENTINEL_FINGERPRINT;

    try {
        auto plan = choose_plan(root, normalized);
        bool exact = std::holds_alternative<ExactPlan>(plan);
        auto result = run_plan(plan, root);
        volt_logf(LogLevel::Info, "fingerprint [{}] via {}: {}",
                  fmt::join(normalized, ", "), exact ? "tree hash" : "sampling", result);
        return result;
    } catch (const std::exception& e) {
        volt_logf(LogLevel::Error, "fingerprint failed: {}", e.what());
        return SENTINEL_FINGERPRINT;
    }
}

} // namespace fingerprint
