#include "digest.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace fingerprint {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, std::size_t len) {
    if (len > 0) EVP_DigestUpdate(ctx_, data, len);
}

void Sha256::update_u64(std::uint64_t v) {
    unsigned char buf[8];
    for (int i = 0; i < 8; i++) buf[i] = static_cast<unsigned char>(v >> (i * 8));
    update(buf, sizeof(buf));
}

Digest Sha256::finish() {
    Digest out{};
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, out.data(), &len);
    return out;
}

Digest sha256(const std::string& data) {
    Sha256 h;
    h.update(data);
    return h.finish();
}

std::uint64_t digest_prefix_u64(const Digest& d) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; i--) v = (v << 8) | d[i];
    return v;
}

std::string to_hex(const unsigned char* data, std::size_t len) {
    static const char TABLE[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; i++) {
        out += TABLE[data[i] >> 4];
        out += TABLE[data[i] & 0xf];
    }
    return out;
}

} // namespace fingerprint
