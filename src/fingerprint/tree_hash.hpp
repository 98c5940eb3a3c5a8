#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace fingerprint {

// Exact content hash of a directory tree (SHA-256 Merkle tree).
//
//   file     -> sha256(bytes)
//   symlink  -> sha256(target text), never followed
//   dir      -> sha256(child digests, in child-name order)
//
// Names never enter a digest: renaming a file without touching its bytes
// leaves the hash unchanged. Other file types (sockets, fifos) are skipped.
//
// Returns nullopt when any entry cannot be read; the caller falls back to the
// sampling hash. Returns 64 lowercase hex characters otherwise.
std::optional<std::string> exact_tree_hash(const std::filesystem::path& dir);

} // namespace fingerprint
