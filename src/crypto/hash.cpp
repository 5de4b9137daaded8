#include "torlink/crypto/hash.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace torlink::crypto {

std::expected<Sha256Digest, HashError> sha256(std::span<const uint8_t> data) {
    Sha256Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1 ||
        digest_len != digest.size()) {
        return std::unexpected(HashError::DigestFailed);
    }
    return digest;
}

std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(data.size() * 2, '0');
    for (size_t i = 0; i < data.size(); ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

std::string hash_error_message(HashError err) {
    switch (err) {
        case HashError::DigestFailed: return "SHA-256 digest failed";
        default: return "Unknown hash error";
    }
}

bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace torlink::crypto
