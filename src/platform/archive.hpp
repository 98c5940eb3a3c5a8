#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <filesystem>

namespace platform {

// Decode, encode or extraction failure in the archive codec.
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PackStats {
    std::size_t entries = 0;
    std::uint64_t input_bytes = 0;       // uncompressed file content
};

// Pack root/dir for each dir into one zstd-compressed pax tar held in memory.
// Entry names keep the configured directory as their first component, so
// the archive restores relative to the same root. Directories that do not
// exist are skipped; unreadable files are skipped.
// Throws ArchiveError if the archive itself cannot be produced.
std::string pack_dirs(const std::filesystem::path& root,
                      const std::vector<std::string>& dirs,
                      PackStats* stats = nullptr);

// Replace root/dir for each dir with the archive's contents.
//
// The whole archive is decoded in memory first; a corrupt or truncated
// archive throws ArchiveError before anything on disk changes. Then every
// configured directory is removed and the entries are written. If writing
// fails, the configured directories are removed again so they are left
// empty rather than partially populated, and ArchiveError is thrown.
// Entries outside the configured directories are ignored.
void unpack_dirs(const std::string& data,
                 const std::filesystem::path& root,
                 const std::vector<std::string>& dirs);

} // namespace platform
