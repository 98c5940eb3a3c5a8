#pragma once

#include <cstddef>
#include <cstdint>

// ── Fingerprinting ──────────────────────────────────────────
constexpr std::size_t EXACT_HASH_MAX_FILES = 1000;      // above this, sample instead of tree-hashing
constexpr double SAMPLE_RATE               = 0.1;       // share of files whose content is sampled
constexpr std::size_t SAMPLE_CHUNK_BYTES   = 64 * 1024; // content read per sampled file
constexpr int COMBINE_ROUNDS               = 4;
constexpr const char* SENTINEL_FINGERPRINT =
    "0000000000000000000000000000000000000000000000000000000000000000";

// ── Archive ─────────────────────────────────────────────────
constexpr int ZSTD_LEVEL                          = 3;
constexpr int ZSTD_THREADS                        = 4;
constexpr std::int64_t PARALLEL_COMPRESS_MIN_BYTES = 8LL * 1024 * 1024;  // 8 MiB of input
constexpr std::size_t ARCHIVE_IO_BUF_SIZE         = 65536;

// ── Protocol ────────────────────────────────────────────────
constexpr const char* HASH_HEADER          = "X-Volt-Hash";
constexpr const char* ARCHIVE_ENCODING     = "zstd";
constexpr const char* ARCHIVE_SUFFIX       = ".zst";
constexpr const char* HASH_SUFFIX          = ".hash";
constexpr const char* STAGING_SUFFIX       = ".part";

// ── Timeouts ────────────────────────────────────────────────
constexpr long HTTP_CONNECT_TIMEOUT_MS     = 10000;
constexpr int DEFAULT_TRANSFER_TIMEOUT_SECS = 300;
constexpr int DEFAULT_IDLE_TIMEOUT_SECS    = 60;   // server: longest wait for the next byte

// ── Files ───────────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILE  = "volt.yaml";
constexpr const char* SERVER_CONFIG_FILE   = "config.yaml";
constexpr const char* DEFAULT_SERVER_ADDRESS = "0.0.0.0:8080";
constexpr const char* VOLT_VERSION         = "0.4.0";
