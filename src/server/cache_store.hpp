#pragma once

#include <string>
#include <optional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

enum class StoreStatus {
    Ok,
    NotModified,    // stored fingerprint equals the request's
    Changed,        // check only: stored fingerprint differs
    NotFound,
    BadRequest,     // malformed slot id or missing fingerprint
    StorageError,
};

// Owns an open archive descriptor until handed to the response.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept : fd_(other.release()) {}
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();

private:
    int fd_ = -1;
};

struct PullResult {
    StoreStatus status = StoreStatus::StorageError;
    FileHandle archive;
    std::uint64_t size = 0;
    std::string fingerprint;    // stored value paired with `archive`, empty when none
};

// Upload written beside the archive, not yet visible to readers.
struct StagedUpload {
    std::string slot_id;
    fs::path path;
};

// Server-side storage: {slot}.zst and {slot}.hash under one root directory.
// Every path is derived from a slot id that has already passed is_valid_uuid.
class CacheStore {
public:
    explicit CacheStore(fs::path root);

    // Reserve a staging file for an incoming archive.
    StoreStatus begin_push(const std::string& slot_id, StagedUpload& out);

    // Publish a fully written staging file and its fingerprint as one
    // critical section on the slot.
    StoreStatus commit_push(const StagedUpload& upload, const std::string& fingerprint);

    // Drop a staging file after a failed upload.
    void abort_push(const StagedUpload& upload);

    // begin/write/commit for a body already in memory.
    StoreStatus push(const std::string& slot_id, const std::string& body,
                     const std::string& fingerprint);

    // A missing fingerprint is BadRequest.
    PullResult pull(const std::string& slot_id,
                    const std::optional<std::string>& fingerprint);

    StoreStatus check(const std::string& slot_id,
                      const std::optional<std::string>& fingerprint);

    // Stored fingerprint for a slot, nullopt when none.
    std::optional<std::string> stored_fingerprint(const std::string& slot_id);

    // Delete staging files left behind by a previous process. Returns the count.
    int remove_stale_staging();

    fs::path archive_path(const std::string& slot_id) const;
    fs::path hash_path(const std::string& slot_id) const;
    const fs::path& root() const { return root_; }

    // Entries in the per-slot lock table, including ones not yet pruned.
    std::size_t tracked_slots();

private:
    fs::path root_;
    std::mutex locks_mutex_;
    // Entries live as long as some request holds the lock
    std::unordered_map<std::string, std::weak_ptr<std::shared_mutex>> locks_;

    std::shared_ptr<std::shared_mutex> slot_lock(const std::string& slot_id);
    std::optional<std::string> read_hash(const std::string& slot_id) const;
};
