#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <thread>

namespace fingerprint {

// A regular file found under one of the fingerprinted directories.
struct FileRef {
    std::string rel;                 // path relative to the project root, '/'-separated
    std::filesystem::path abs;
};

// Regular files (symlinks excluded) under root/dir for each dir, sorted by
// relative path with duplicates removed. Unreadable subtrees are skipped.
std::vector<FileRef> list_regular_files(const std::filesystem::path& root,
                                        const std::vector<std::string>& dirs);

// Number of regular files under root/dir for each dir.
std::size_t count_regular_files(const std::filesystem::path& root,
                                const std::vector<std::string>& dirs);

// Deterministic per-path coin flip: true for roughly SAMPLE_RATE of paths.
bool should_sample(const std::string& rel_path);

// 64-bit digest of one file: path, size, whole-second mtime, plus the first
// SAMPLE_CHUNK_BYTES of content when should_sample(path). Never fails: a file
// that cannot be stat'ed or read contributes what could be gathered.
std::uint64_t file_digest(const FileRef& file);

using ThreadStarter = std::function<std::thread(std::function<void()>)>;

// Runs work(slot) for slots 0..workers-1: slot 0 on the calling thread, the
// others on threads made by `start` (std::thread by default). If a thread
// cannot be started the remaining slots are skipped, so `work` must share
// its input between slots rather than partition it up front. Every started
// thread is joined before returning.
void fan_out(unsigned workers, const std::function<void(unsigned)>& work,
             const ThreadStarter& start = {});

// Sampling hash over the union of all files under the given directories,
// rendered as 16 lowercase hex characters.
//
// Per-file digests are computed on a pool of worker threads and reduced with
// XOR. XOR is associative and commutative, so the result does not depend on
// how files are distributed across workers or in which order they finish.
// Any other reduction must keep both properties.
std::string sampling_hash(const std::filesystem::path& root,
                          const std::vector<std::string>& dirs,
                          unsigned workers = 0);

} // namespace fingerprint
