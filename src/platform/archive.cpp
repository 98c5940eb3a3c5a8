#include "archive.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct WriterDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ReaderDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriter = std::unique_ptr<struct archive, WriterDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ReaderDeleter>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, EntryDeleter>;

std::string error_of(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

la_ssize_t append_to_string(struct archive*, void* client, const void* buf, size_t len) {
    static_cast<std::string*>(client)->append(static_cast<const char*>(buf), len);
    return static_cast<la_ssize_t>(len);
}

// ── Pack ─────────────────────────────────────────────────────

struct PackItem {
    std::string rel;
    fs::path abs;
    struct stat st;
};

std::vector<PackItem> collect_items(const fs::path& root, const std::vector<std::string>& dirs) {
    std::vector<PackItem> items;

    for (const auto& dir : dirs) {
        fs::path base = root / dir;
        struct stat st;
        if (::lstat(base.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            volt_logf(LogLevel::Warn, "pack: skipping missing directory {}", dir);
            continue;
        }
        items.push_back({fs::path(dir).lexically_normal().generic_string(), base, st});

        std::error_code ec;
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        if (ec) continue;
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const auto& p = it->path();
            if (::lstat(p.c_str(), &st) != 0) continue;
            if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode) && !S_ISLNK(st.st_mode)) continue;
            items.push_back({p.lexically_relative(root).generic_string(), p, st});
        }
    }

    // Parents sort before their children; overlapping dirs collapse
    std::sort(items.begin(), items.end(),
              [](const PackItem& a, const PackItem& b) { return a.rel < b.rel; });
    items.erase(std::unique(items.begin(), items.end(),
                            [](const PackItem& a, const PackItem& b) { return a.rel == b.rel; }),
                items.end());
    for (auto& item : items) {
        while (item.rel.size() > 1 && item.rel.back() == '/') item.rel.pop_back();
    }
    return items;
}

// Write one entry. Returns false if the entry was skipped.
bool write_item(struct archive* a, struct archive_entry* entry, const PackItem& item) {
    std::ifstream in;
    if (S_ISREG(item.st.st_mode)) {
        in.open(item.abs, std::ios::binary);
        if (!in) {
            volt_logf(LogLevel::Warn, "pack: cannot read {}, skipped", item.rel);
            return false;
        }
    }

    archive_entry_clear(entry);
    archive_entry_copy_stat(entry, &item.st);
    archive_entry_set_pathname(entry, item.rel.c_str());

    if (S_ISLNK(item.st.st_mode)) {
        std::error_code ec;
        auto target = fs::read_symlink(item.abs, ec);
        if (ec) {
            volt_logf(LogLevel::Warn, "pack: cannot read link {}, skipped", item.rel);
            return false;
        }
        archive_entry_set_size(entry, 0);
        archive_entry_set_symlink(entry, target.c_str());
    } else if (S_ISDIR(item.st.st_mode)) {
        archive_entry_set_size(entry, 0);
    }

    int r = archive_write_header(a, entry);
    if (r == ARCHIVE_FATAL) {
        throw ArchiveError(fmt::format("Failed to write archive header for {}: {}", item.rel, error_of(a)));
    }
    if (r < ARCHIVE_WARN) {
        volt_logf(LogLevel::Warn, "pack: {} skipped: {}", item.rel, error_of(a));
        return false;
    }

    if (S_ISREG(item.st.st_mode)) {
        std::vector<char> buf(ARCHIVE_IO_BUF_SIZE);
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto n = in.gcount();
            if (n > 0 && archive_write_data(a, buf.data(), static_cast<size_t>(n)) < 0) {
                throw ArchiveError(fmt::format("Failed to write {} into archive: {}", item.rel, error_of(a)));
            }
        }
    }
    return true;
}

// ── Unpack ───────────────────────────────────────────────────

struct Extracted {
    std::string rel;
    mode_t type = 0;
    mode_t perm = 0644;
    time_t mtime = 0;
    std::string link;
    std::string data;
};

// Relative, no "..", normalized with '/' separators. Empty on rejection.
std::string sanitize_entry_path(const char* name) {
    if (!name || !*name) return "";
    fs::path p = fs::path(name).lexically_normal();
    if (p.is_absolute() || p.has_root_directory()) return "";
    for (const auto& part : p) {
        if (part == "..") return "";
    }
    std::string s = p.generic_string();
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.empty() || s == ".") return "";
    return s;
}

bool is_within(const std::string& rel, const std::string& dir) {
    fs::path r(rel);
    fs::path d = fs::path(dir).lexically_normal();
    auto ri = r.begin();
    for (const auto& part : d) {
        if (part.empty() || part == ".") continue;
        if (ri == r.end() || *ri != part) return false;
        ++ri;
    }
    return true;
}

std::vector<Extracted> decode_all(const std::string& data) {
    if (data.empty()) throw ArchiveError("Archive is empty");

    ArchiveReader a(archive_read_new());
    if (!a) throw ArchiveError("Failed to create archive reader");

    archive_read_support_filter_zstd(a.get());
    archive_read_support_format_tar(a.get());

    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw ArchiveError("Failed to open archive: " + error_of(a.get()));
    }

    std::vector<Extracted> out;
    std::vector<char> buf(ARCHIVE_IO_BUF_SIZE);

    for (;;) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw ArchiveError("Corrupt archive: " + error_of(a.get()));
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string rel = sanitize_entry_path(raw_name);
        if (rel.empty()) {
            throw ArchiveError(fmt::format("Archive entry with unsafe path '{}'", raw_name ? raw_name : ""));
        }

        Extracted x;
        x.rel = rel;
        x.type = archive_entry_filetype(entry);
        x.perm = archive_entry_perm(entry);
        x.mtime = archive_entry_mtime(entry);

        if (x.type == AE_IFLNK) {
            const char* target = archive_entry_symlink(entry);
            x.link = target ? target : "";
        } else if (x.type == AE_IFREG) {
            la_ssize_t n;
            while ((n = archive_read_data(a.get(), buf.data(), buf.size())) > 0) {
                x.data.append(buf.data(), static_cast<size_t>(n));
            }
            if (n < 0) {
                throw ArchiveError(fmt::format("Corrupt archive data for {}: {}", rel, error_of(a.get())));
            }
        } else if (x.type != AE_IFDIR) {
            continue;  // devices, fifos: never packed by us
        }

        out.push_back(std::move(x));
    }

    return out;
}

void clear_dirs(const fs::path& root, const std::vector<std::string>& dirs) {
    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::remove_all(root / dir, ec);
        if (ec) {
            throw ArchiveError(fmt::format("Failed to clear {}: {}", dir, ec.message()));
        }
    }
}

// True if some existing ancestor of root/rel (below root) is a symlink
bool has_symlink_ancestor(const fs::path& root, const std::string& rel) {
    fs::path cur = root;
    fs::path r(rel);
    for (auto it = r.begin(); it != r.end(); ++it) {
        if (std::next(it) == r.end()) break;
        cur /= *it;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(cur, ec))) return true;
    }
    return false;
}

void set_mtime(const fs::path& path, time_t mtime) {
    struct timespec times[2];
    times[0].tv_sec = mtime;
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        volt_logf(LogLevel::Warn, "unpack: cannot set mtime of {}: {}", path.string(), std::strerror(errno));
    }
}

void write_entries(const fs::path& root, const std::vector<Extracted>& entries,
                   const std::vector<std::string>& dirs) {
    std::vector<const Extracted*> created_dirs;

    for (const auto& x : entries) {
        bool wanted = std::any_of(dirs.begin(), dirs.end(),
                                  [&](const std::string& d) { return is_within(x.rel, d); });
        if (!wanted) {
            volt_logf(LogLevel::Warn, "unpack: {} is outside the cache directories, ignored", x.rel);
            continue;
        }
        if (has_symlink_ancestor(root, x.rel)) {
            throw ArchiveError(fmt::format("Archive entry {} would be written through a symlink", x.rel));
        }

        fs::path target = root / x.rel;
        fs::create_directories(target.parent_path());

        if (x.type == AE_IFDIR) {
            fs::create_directories(target);
            created_dirs.push_back(&x);
            continue;
        }

        std::error_code ec;
        if (fs::symlink_status(target, ec).type() != fs::file_type::not_found) {
            fs::remove_all(target);
        }

        if (x.type == AE_IFLNK) {
            fs::create_symlink(x.link, target);
            set_mtime(target, x.mtime);
            continue;
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) throw ArchiveError("Failed to create " + target.string());
        out.write(x.data.data(), static_cast<std::streamsize>(x.data.size()));
        out.close();
        if (!out) throw ArchiveError("Failed to write " + target.string());

        fs::permissions(target, static_cast<fs::perms>(x.perm & 0777), ec);
        set_mtime(target, x.mtime);
    }

    // Directory modes and times last, deepest first, so read-only
    // directories do not block their own contents
    for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
        fs::path target = root / (*it)->rel;
        std::error_code ec;
        fs::permissions(target, static_cast<fs::perms>((*it)->perm & 0777), ec);
        set_mtime(target, (*it)->mtime);
    }
}

} // namespace

std::string pack_dirs(const fs::path& root, const std::vector<std::string>& dirs, PackStats* stats) {
    auto items = collect_items(root, dirs);

    std::uint64_t input_bytes = 0;
    for (const auto& item : items) {
        if (S_ISREG(item.st.st_mode)) input_bytes += static_cast<std::uint64_t>(item.st.st_size);
    }

    ArchiveWriter a(archive_write_new());
    if (!a) throw ArchiveError("Failed to create archive writer");

    if (archive_write_set_format_pax_restricted(a.get()) != ARCHIVE_OK) {
        throw ArchiveError("Failed to select tar format: " + error_of(a.get()));
    }
    if (archive_write_add_filter_zstd(a.get()) < ARCHIVE_WARN) {
        throw ArchiveError("zstd compression unavailable: " + error_of(a.get()));
    }
    if (archive_write_set_filter_option(a.get(), "zstd", "compression-level",
                                        std::to_string(ZSTD_LEVEL).c_str()) != ARCHIVE_OK) {
        volt_logf(LogLevel::Warn, "pack: cannot set zstd level {}: {}", ZSTD_LEVEL, error_of(a.get()));
    }
    if (static_cast<std::int64_t>(input_bytes) >= PARALLEL_COMPRESS_MIN_BYTES) {
        if (archive_write_set_filter_option(a.get(), "zstd", "threads",
                                            std::to_string(ZSTD_THREADS).c_str()) != ARCHIVE_OK) {
            volt_log(LogLevel::Warn, "pack: multi-threaded zstd not supported, compressing on one thread");
        }
    }
    archive_write_set_bytes_in_last_block(a.get(), 1);

    std::string out;
    if (archive_write_open(a.get(), &out, nullptr, append_to_string, nullptr) != ARCHIVE_OK) {
        throw ArchiveError("Failed to open archive: " + error_of(a.get()));
    }

    ArchiveEntry entry(archive_entry_new());
    size_t written = 0;
    for (const auto& item : items) {
        if (write_item(a.get(), entry.get(), item)) written++;
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw ArchiveError("Failed to finish archive: " + error_of(a.get()));
    }

    if (stats) {
        stats->entries = written;
        stats->input_bytes = input_bytes;
    }
    volt_logf(LogLevel::Info, "pack: {} entries, {} bytes in, {} bytes out", written, input_bytes, out.size());
    return out;
}

void unpack_dirs(const std::string& data, const fs::path& root, const std::vector<std::string>& dirs) {
    auto entries = decode_all(data);

    clear_dirs(root, dirs);

    try {
        write_entries(root, entries, dirs);
    } catch (const std::exception& e) {
        volt_logf(LogLevel::Error, "unpack failed, clearing cache directories: {}", e.what());
        for (const auto& dir : dirs) {
            std::error_code ec;
            fs::remove_all(root / dir, ec);
        }
        throw ArchiveError(std::string("Extraction failed: ") + e.what());
    }

    volt_logf(LogLevel::Info, "unpack: {} entries restored", entries.size());
}

} // namespace platform
