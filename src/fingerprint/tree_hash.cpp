#include "tree_hash.hpp"
#include "digest.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace fingerprint {

static bool hash_file(const fs::path& path, Digest& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    Sha256 h;
    std::vector<char> buf(ARCHIVE_IO_BUF_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n > 0) h.update(buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) return false;

    out = h.finish();
    return true;
}

static bool hash_node(const fs::path& path, const fs::file_status& st, Digest& out);

static bool hash_dir(const fs::path& dir, Digest& out) {
    std::error_code ec;
    std::vector<std::pair<std::string, fs::file_status>> children;

    fs::directory_iterator it(dir, ec);
    if (ec) return false;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return false;
        auto st = it->symlink_status(ec);
        if (ec) return false;
        children.emplace_back(it->path().filename().string(), st);
    }
    if (ec) return false;

    std::sort(children.begin(), children.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    Sha256 h;
    for (const auto& [name, st] : children) {
        if (!fs::is_regular_file(st) && !fs::is_directory(st) && !fs::is_symlink(st)) continue;

        Digest child;
        if (!hash_node(dir / name, st, child)) return false;
        h.update(child.data(), child.size());
    }
    out = h.finish();
    return true;
}

static bool hash_node(const fs::path& path, const fs::file_status& st, Digest& out) {
    if (fs::is_symlink(st)) {
        std::error_code ec;
        auto target = fs::read_symlink(path, ec);
        if (ec) return false;
        out = sha256(target.string());
        return true;
    }
    if (fs::is_directory(st)) return hash_dir(path, out);
    return hash_file(path, out);
}

std::optional<std::string> exact_tree_hash(const fs::path& dir) {
    std::error_code ec;
    auto st = fs::status(dir, ec);
    if (ec || !fs::is_directory(st)) return std::nullopt;

    Digest root;
    if (!hash_dir(dir, root)) {
        volt_logf(LogLevel::Warn, "tree hash of {} failed, falling back to sampling", dir.string());
        return std::nullopt;
    }
    return to_hex(root);
}

} // namespace fingerprint
