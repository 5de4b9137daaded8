#include "torlink/protocol/ed25519_cert.hpp"
#include "torlink/protocol/binary_io.hpp"
#include "torlink/util/logging.hpp"
#include <cstring>
#include <format>

namespace torlink::protocol {

std::optional<std::array<uint8_t, ED25519_KEY_LEN>> Ed25519Cert::signing_key() const {
    for (const auto& ext : extensions) {
        if (ext.ext_type == EXT_SIGNED_WITH_ED25519_KEY &&
            ext.ext_data.size() == ED25519_KEY_LEN) {
            std::array<uint8_t, ED25519_KEY_LEN> key{};
            std::memcpy(key.data(), ext.ext_data.data(), ED25519_KEY_LEN);
            return key;
        }
    }
    return std::nullopt;
}

util::Result<Ed25519Cert> parse_ed25519_cert(
    std::span<const uint8_t> body, uint8_t outer_type) {
    if (body.size() < ED25519_CERT_HEADER_LEN + ED25519_SIG_LEN) {
        return std::unexpected(util::Error::invalid_format(
            std::format("Ed25519 certificate of {} bytes is shorter than {}",
                        body.size(), ED25519_CERT_HEADER_LEN + ED25519_SIG_LEN)));
    }

    BinaryReader reader(body);
    Ed25519Cert cert;
    cert.cert_type = outer_type;
    cert.format_version = TORLINK_TRY(reader.read_u8());
    cert.embedded_cert_type = TORLINK_TRY(reader.read_u8());
    cert.expiration_date = TORLINK_TRY(reader.read_u32());
    cert.cert_key_type = TORLINK_TRY(reader.read_u8());
    cert.certified_key = TORLINK_TRY(reader.read_array<ED25519_KEY_LEN>());
    uint8_t n_extensions = TORLINK_TRY(reader.read_u8());

    if (cert.embedded_cert_type != outer_type) {
        LOG_DEBUG("Ed25519 certificate tagged {} claims type {}",
                  outer_type, cert.embedded_cert_type);
    }

    cert.extensions.reserve(n_extensions);
    for (uint8_t i = 0; i < n_extensions; ++i) {
        uint16_t ext_len = TORLINK_TRY(reader.read_u16());
        CertExtension ext;
        ext.ext_type = TORLINK_TRY(reader.read_u8());
        ext.ext_flags = TORLINK_TRY(reader.read_u8());
        ext.ext_data = TORLINK_TRY(reader.read_bytes(ext_len));
        cert.extensions.push_back(std::move(ext));
    }

    if (reader.remaining() != ED25519_SIG_LEN) {
        return std::unexpected(util::Error::invalid_format(
            std::format("Ed25519 certificate has {} bytes after extensions, "
                        "expected a {}-byte signature",
                        reader.remaining(), ED25519_SIG_LEN)));
    }

    size_t signed_len = reader.position();
    cert.signature = TORLINK_TRY(reader.read_array<ED25519_SIG_LEN>());
    cert.pre_signature_bytes.assign(body.begin(), body.begin() + signed_len);

    return cert;
}

}  // namespace torlink::protocol
