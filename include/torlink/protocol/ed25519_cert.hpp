#pragma once

#include "torlink/util/result.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace torlink::protocol {

constexpr size_t ED25519_KEY_LEN = 32;
constexpr size_t ED25519_SIG_LEN = 64;

// version, cert_type, expiration, cert_key_type, certified_key, n_extensions
constexpr size_t ED25519_CERT_HEADER_LEN = 1 + 1 + 4 + 1 + ED25519_KEY_LEN + 1;

// Certificate types carried in CERTS (cert-spec, "Certificate types")
enum class CertType : uint8_t {
    Link = 1,
    RsaIdentity = 2,
    RsaAuthenticate = 3,
    IdentityV1Signing = 4,
    SigningV1TlsCert = 5,
    SigningV1Authenticate = 6,
    RsaCrosscert = 7,
    SigningV1ReducedLink = 8,
    Ntor = 9,
    NtorCrosscert = 10,
    SigningHsDescriptor = 11,
};

// Extension types
constexpr uint8_t EXT_SIGNED_WITH_ED25519_KEY = 4;

// Flag bit: the extension affects validation
constexpr uint8_t EXT_FLAG_AFFECTS_VALIDATION = 0x01;

// Tags whose body is an Ed25519 certificate
[[nodiscard]] constexpr bool is_ed25519_cert_type(uint8_t type) {
    switch (type) {
        case 4: case 5: case 6: case 8: case 9: case 10: case 11:
            return true;
        default:
            return false;
    }
}

struct CertExtension {
    uint8_t ext_type{0};
    uint8_t ext_flags{0};
    std::vector<uint8_t> ext_data;

    bool operator==(const CertExtension&) const = default;
};

struct Ed25519Cert {
    uint8_t cert_type{0};           // Tag from the enclosing CERTS entry
    uint8_t embedded_cert_type{0};  // Type byte inside the body
    uint8_t format_version{0};
    uint32_t expiration_date{0};    // Hours since the Unix epoch
    uint8_t cert_key_type{0};
    std::array<uint8_t, ED25519_KEY_LEN> certified_key{};
    std::vector<CertExtension> extensions;
    std::array<uint8_t, ED25519_SIG_LEN> signature{};
    std::vector<uint8_t> pre_signature_bytes;  // Everything the signature covers

    [[nodiscard]] std::chrono::system_clock::time_point expiration_time() const {
        return std::chrono::system_clock::time_point(std::chrono::hours(expiration_date));
    }

    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point now) const {
        return now >= expiration_time();
    }

    // Key from the signed-with-ed25519-key extension, if present
    [[nodiscard]] std::optional<std::array<uint8_t, ED25519_KEY_LEN>> signing_key() const;

    bool operator==(const Ed25519Cert&) const = default;
};

// Parse an Ed25519 certificate body. outer_type is the CERTS entry tag and
// becomes cert_type; the embedded type byte is kept but not trusted.
[[nodiscard]] util::Result<Ed25519Cert> parse_ed25519_cert(
    std::span<const uint8_t> body, uint8_t outer_type);

}  // namespace torlink::protocol
