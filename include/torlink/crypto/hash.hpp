#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace torlink::crypto {

constexpr size_t SHA256_DIGEST_LEN = 32;

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_LEN>;

enum class HashError {
    DigestFailed,
};

// SHA-256 of a whole buffer (OpenSSL EVP)
[[nodiscard]] std::expected<Sha256Digest, HashError>
sha256(std::span<const uint8_t> data);

// Lowercase hex, for log and error messages
[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);

[[nodiscard]] std::string hash_error_message(HashError err);

// CRYPTO_memcmp over equal-length inputs; different lengths compare unequal
[[nodiscard]] bool constant_time_compare(std::span<const uint8_t> a,
                                         std::span<const uint8_t> b);

}  // namespace torlink::crypto
