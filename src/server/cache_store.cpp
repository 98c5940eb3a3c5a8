#include "cache_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// ── FileHandle ──────────────────────────────────────────────

FileHandle::~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.release();
    }
    return *this;
}

int FileHandle::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

// ── CacheStore ──────────────────────────────────────────────

namespace {

std::string staging_name(const std::string& base) {
    return base + "." + generate_uuid_v4().substr(0, 8) + STAGING_SUFFIX;
}

} // namespace

CacheStore::CacheStore(fs::path root) : root_(std::move(root)) {}

fs::path CacheStore::archive_path(const std::string& slot_id) const {
    return root_ / (slot_id + ARCHIVE_SUFFIX);
}

fs::path CacheStore::hash_path(const std::string& slot_id) const {
    return root_ / (slot_id + HASH_SUFFIX);
}

std::shared_ptr<std::shared_mutex> CacheStore::slot_lock(const std::string& slot_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = locks_.find(slot_id);
    if (it != locks_.end()) {
        if (auto existing = it->second.lock()) return existing;
    }

    for (auto e = locks_.begin(); e != locks_.end();) {
        if (e->second.expired()) e = locks_.erase(e);
        else ++e;
    }

    auto created = std::make_shared<std::shared_mutex>();
    locks_[slot_id] = created;
    return created;
}

std::size_t CacheStore::tracked_slots() {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return locks_.size();
}

std::optional<std::string> CacheStore::read_hash(const std::string& slot_id) const {
    std::ifstream in(hash_path(slot_id));
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    std::string value = ss.str();
    trim(value);
    return value;
}

StoreStatus CacheStore::begin_push(const std::string& slot_id, StagedUpload& out) {
    if (!is_valid_uuid(slot_id)) return StoreStatus::BadRequest;

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        volt_logf(LogLevel::Error, "cannot create cache dir {}: {}", root_.string(), ec.message());
        return StoreStatus::StorageError;
    }

    out.slot_id = slot_id;
    out.path = root_ / staging_name(slot_id + ARCHIVE_SUFFIX);
    return StoreStatus::Ok;
}

StoreStatus CacheStore::commit_push(const StagedUpload& upload, const std::string& fingerprint) {
    // The fingerprint goes to its own staging file first so that the
    // critical section below is two renames.
    fs::path hash_tmp = root_ / staging_name(upload.slot_id + HASH_SUFFIX);
    {
        std::ofstream out(hash_tmp, std::ios::binary | std::ios::trunc);
        out << fingerprint;
        out.close();
        if (!out) {
            volt_logf(LogLevel::Error, "cannot write {}", hash_tmp.string());
            std::error_code ignored;
            fs::remove(hash_tmp, ignored);
            abort_push(upload);
            return StoreStatus::StorageError;
        }
    }

    auto lock = slot_lock(upload.slot_id);
    std::unique_lock<std::shared_mutex> guard(*lock);

    std::error_code ec;
    fs::rename(upload.path, archive_path(upload.slot_id), ec);
    if (ec) {
        volt_logf(LogLevel::Error, "cannot publish archive for {}: {}",
                  upload.slot_id, ec.message());
        std::error_code ignored;
        fs::remove(hash_tmp, ignored);
        fs::remove(upload.path, ignored);
        return StoreStatus::StorageError;
    }

    fs::rename(hash_tmp, hash_path(upload.slot_id), ec);
    if (ec) {
        // A stale fingerprint next to the new archive would pair them wrongly.
        volt_logf(LogLevel::Error, "cannot publish fingerprint for {}: {}",
                  upload.slot_id, ec.message());
        std::error_code ignored;
        fs::remove(hash_path(upload.slot_id), ignored);
        fs::remove(hash_tmp, ignored);
        return StoreStatus::StorageError;
    }

    return StoreStatus::Ok;
}

void CacheStore::abort_push(const StagedUpload& upload) {
    if (upload.path.empty()) return;
    std::error_code ec;
    fs::remove(upload.path, ec);
    if (ec) volt_logf(LogLevel::Warn, "cannot remove {}: {}", upload.path.string(), ec.message());
}

StoreStatus CacheStore::push(const std::string& slot_id, const std::string& body,
                             const std::string& fingerprint) {
    StagedUpload upload;
    StoreStatus status = begin_push(slot_id, upload);
    if (status != StoreStatus::Ok) return status;

    std::ofstream out(upload.path, std::ios::binary | std::ios::trunc);
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.close();
    if (!out) {
        volt_logf(LogLevel::Error, "cannot write {}", upload.path.string());
        abort_push(upload);
        return StoreStatus::StorageError;
    }

    return commit_push(upload, fingerprint);
}

PullResult CacheStore::pull(const std::string& slot_id,
                            const std::optional<std::string>& fingerprint) {
    PullResult result;
    if (!is_valid_uuid(slot_id) || !fingerprint) {
        result.status = StoreStatus::BadRequest;
        return result;
    }

    auto lock = slot_lock(slot_id);
    std::shared_lock<std::shared_mutex> guard(*lock);

    auto stored = read_hash(slot_id);
    if (stored && *stored == *fingerprint) {
        result.status = StoreStatus::NotModified;
        return result;
    }

    int fd = ::open(archive_path(slot_id).c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            result.status = StoreStatus::NotFound;
        } else {
            volt_logf(LogLevel::Error, "cannot open archive for {}: {}",
                      slot_id, std::strerror(errno));
            result.status = StoreStatus::StorageError;
        }
        return result;
    }
    result.archive = FileHandle(fd);

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        volt_logf(LogLevel::Error, "cannot stat archive for {}: {}",
                  slot_id, std::strerror(errno));
        result.archive = FileHandle();
        result.status = StoreStatus::StorageError;
        return result;
    }

    result.size = static_cast<std::uint64_t>(st.st_size);
    result.fingerprint = stored.value_or("");
    result.status = StoreStatus::Ok;
    return result;
}

StoreStatus CacheStore::check(const std::string& slot_id,
                              const std::optional<std::string>& fingerprint) {
    if (!is_valid_uuid(slot_id)) return StoreStatus::BadRequest;

    auto stored = stored_fingerprint(slot_id);
    if (!stored) return StoreStatus::NotFound;
    if (!fingerprint) return StoreStatus::BadRequest;
    return *stored == *fingerprint ? StoreStatus::NotModified : StoreStatus::Changed;
}

std::optional<std::string> CacheStore::stored_fingerprint(const std::string& slot_id) {
    if (!is_valid_uuid(slot_id)) return std::nullopt;
    auto lock = slot_lock(slot_id);
    std::shared_lock<std::shared_mutex> guard(*lock);
    return read_hash(slot_id);
}

int CacheStore::remove_stale_staging() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return 0;

    int removed = 0;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        const auto name = entry.path().filename().string();
        if (name.size() <= std::strlen(STAGING_SUFFIX)) continue;
        if (name.compare(name.size() - std::strlen(STAGING_SUFFIX),
                         std::string::npos, STAGING_SUFFIX) != 0) continue;
        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) removed++;
    }
    if (ec) volt_logf(LogLevel::Warn, "cannot scan {}: {}", root_.string(), ec.message());
    return removed;
}
