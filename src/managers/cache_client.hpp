#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>
#include <http/client.hpp>

namespace fs = std::filesystem;

// Everything the client needs about the project, passed in explicitly.
struct SyncSettings {
    fs::path root;                          // project directory
    std::string slot_id;                    // cache slot UUID
    std::vector<std::string> cache_dirs;    // restored on pull, packed on push
    std::vector<std::string> hash_dirs;     // fingerprinted; empty = cache_dirs
    long timeout_secs = 300;
};

enum class SyncStatus {
    UpToDate,       // pull/check: server fingerprint matches
    Restored,       // pull: archive downloaded and extracted
    Miss,           // pull/check: nothing stored for this slot
    Changed,        // check: stored fingerprint differs
    Cached,         // push: archive stored
    Alive,          // ping: server answered
    Error,
};

enum class SyncError {
    None,
    Transport,      // connect, TLS, timeout
    Protocol,       // unexpected HTTP status
    Codec,          // archive could not be built or extracted
};

struct SyncOutcome {
    SyncStatus status = SyncStatus::Error;
    SyncError error = SyncError::None;
    std::string message;
    std::chrono::steady_clock::duration elapsed{};
    std::uint64_t bytes = 0;

    bool ok() const { return status != SyncStatus::Error; }

    // "up to date", "restored in 1.20s", "cache miss", "cached 3.1mb in 840ms",
    // "error: <reason>", ...
    std::string describe() const;
};

// Client side of the sync protocol: conditional pull, unconditional push.
class CacheClient {
public:
    // Throws std::invalid_argument if the slot id is not a UUID.
    CacheClient(SyncSettings settings, ServerEndpoint endpoint);

    // Fingerprint local state, ask the server for the archive unless it
    // already has the same fingerprint, and replace the cache directories
    // with what comes back. Nothing on disk changes unless the server
    // returned an archive.
    SyncOutcome pull(StatusCallback cb = nullptr);

    // Pack the cache directories and upload them with a fresh fingerprint.
    SyncOutcome push(StatusCallback cb = nullptr);

    // Compare fingerprints without transferring the archive.
    SyncOutcome check();

    // Authenticated liveness check.
    SyncOutcome ping();

    // Fingerprint of hash_dirs (or cache_dirs when no hash dirs are set).
    std::string fingerprint() const;

    std::string url_for(const std::string& route) const;

    const SyncSettings& settings() const { return settings_; }

private:
    SyncSettings settings_;
    ServerEndpoint endpoint_;
    HttpClient http_;

    std::vector<std::string> headers(const std::string& fingerprint) const;
};
