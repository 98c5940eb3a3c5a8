#include "sampling_hash.hpp"
#include "digest.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace fingerprint {

template <typename Fn>
static void walk_regular_files(const fs::path& root, const std::vector<std::string>& dirs, Fn&& fn) {
    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::path base = root / dir;
        if (!fs::is_directory(base, ec)) continue;

        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        if (ec) continue;
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (it->is_symlink(ec) || !it->is_regular_file(ec)) continue;
            fn(it->path());
        }
    }
}

std::vector<FileRef> list_regular_files(const fs::path& root, const std::vector<std::string>& dirs) {
    std::vector<FileRef> files;
    walk_regular_files(root, dirs, [&](const fs::path& p) {
        files.push_back({p.lexically_relative(root).generic_string(), p});
    });

    std::sort(files.begin(), files.end(),
              [](const FileRef& a, const FileRef& b) { return a.rel < b.rel; });
    files.erase(std::unique(files.begin(), files.end(),
                            [](const FileRef& a, const FileRef& b) { return a.rel == b.rel; }),
                files.end());
    return files;
}

std::size_t count_regular_files(const fs::path& root, const std::vector<std::string>& dirs) {
    std::size_t n = 0;
    walk_regular_files(root, dirs, [&](const fs::path&) { n++; });
    return n;
}

bool should_sample(const std::string& rel_path) {
    double x = static_cast<double>(digest_prefix_u64(sha256(rel_path))) / 18446744073709551616.0;
    return x < SAMPLE_RATE;
}

std::uint64_t file_digest(const FileRef& file) {
    Sha256 h;
    h.update(file.rel);

    struct stat st;
    if (::stat(file.abs.c_str(), &st) == 0) {
        h.update_u64(static_cast<std::uint64_t>(st.st_size));
        h.update_u64(static_cast<std::uint64_t>(st.st_mtime));
    }

    if (should_sample(file.rel)) {
        std::ifstream in(file.abs, std::ios::binary);
        if (in) {
            std::vector<char> buf(SAMPLE_CHUNK_BYTES);
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto n = in.gcount();
            if (n > 0) h.update(buf.data(), static_cast<size_t>(n));
        }
    }

    return digest_prefix_u64(h.finish());
}

void fan_out(unsigned workers, const std::function<void(unsigned)>& work,
             const ThreadStarter& start) {
    std::vector<std::thread> pool;
    if (workers > 1) pool.reserve(workers - 1);

    for (unsigned slot = 1; slot < workers; slot++) {
        try {
            auto fn = [&work, slot] { work(slot); };
            pool.push_back(start ? start(fn) : std::thread(fn));
        } catch (const std::system_error& e) {
            volt_logf(LogLevel::Warn, "started {} of {} hash workers: {}", slot, workers, e.what());
            break;
        }
    }

    work(0);
    for (auto& t : pool) t.join();
}

std::string sampling_hash(const fs::path& root, const std::vector<std::string>& dirs,
                          unsigned workers) {
    auto files = list_regular_files(root, dirs);

    if (workers == 0) workers = platform::worker_count();
    workers = static_cast<unsigned>(std::min<std::size_t>(workers, std::max<std::size_t>(files.size(), 1)));

    // Fan out: each worker folds the files it claims into its own slot
    std::vector<std::uint64_t> partial(workers, 0);
    std::atomic<std::size_t> next{0};

    auto work = [&](unsigned slot) {
        std::uint64_t acc = 0;
        for (std::size_t i = next++; i < files.size(); i = next++) {
            try {
                acc ^= file_digest(files[i]);
            } catch (const std::exception& e) {
                volt_logf(LogLevel::Warn, "skipping {} in sampling hash: {}", files[i].rel, e.what());
            }
        }
        partial[slot] = acc;
    };

    fan_out(workers, work);

    std::uint64_t result = 0;
    for (auto v : partial) result ^= v;

    return fmt::format("{:016x}", result);
}

} // namespace fingerprint
