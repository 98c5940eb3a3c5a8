#pragma once

#include <array>
#include <string>
#include <cstdint>
#include <cstddef>

struct evp_md_ctx_st;

namespace fingerprint {

using Digest = std::array<unsigned char, 32>;

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, std::size_t len);
    void update(const std::string& s) { update(s.data(), s.size()); }

    // Fixed-width little-endian encoding, so digests match across hosts
    void update_u64(std::uint64_t v);

    Digest finish();

private:
    evp_md_ctx_st* ctx_;
};

Digest sha256(const std::string& data);

// First 8 bytes of a digest as a little-endian integer
std::uint64_t digest_prefix_u64(const Digest& d);

std::string to_hex(const unsigned char* data, std::size_t len);
inline std::string to_hex(const Digest& d) { return to_hex(d.data(), d.size()); }

} // namespace fingerprint
