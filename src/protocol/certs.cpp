#include "torlink/protocol/certs.hpp"
#include "torlink/protocol/binary_io.hpp"
#include <format>

namespace torlink::protocol {

util::Result<std::vector<CertEntry>> parse_cert_list(std::span<const uint8_t> payload) {
    if (payload.empty()) {
        return std::unexpected(util::Error::invalid_format("CERTS payload is empty"));
    }

    BinaryReader reader(payload);
    uint8_t n_certs = TORLINK_TRY(reader.read_u8());

    std::vector<CertEntry> entries;
    entries.reserve(n_certs);

    for (uint8_t i = 0; i < n_certs; ++i) {
        auto type = reader.read_u8();
        if (!type) {
            return std::unexpected(util::Error::invalid_format(
                std::format("CERTS declares {} entries, only {} present", n_certs, i)));
        }
        auto len = reader.read_u16();
        if (!len) {
            return std::unexpected(util::Error::invalid_format(
                std::format("CERTS entry {} of {}: {}", i + 1, n_certs, len.error().message())));
        }

        auto body = reader.read_span(*len);
        if (!body) {
            return std::unexpected(util::Error::invalid_format(
                std::format("CERTS entry {} of {} (type {}): {}",
                            i + 1, n_certs, *type, body.error().message())));
        }

        CertEntry entry;
        entry.cert_type = *type;
        if (is_ed25519_cert_type(*type)) {
            auto cert = parse_ed25519_cert(*body, *type);
            if (!cert) {
                return std::unexpected(util::Error::invalid_format(
                    std::format("CERTS entry {} of {} (type {}): {}",
                                i + 1, n_certs, *type, cert.error().message())));
            }
            entry.body = std::move(*cert);
        } else {
            entry.body = OpaqueCert{*type, std::vector<uint8_t>(body->begin(), body->end())};
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

const CertEntry* find_cert(std::span<const CertEntry> entries, uint8_t cert_type) {
    for (const auto& entry : entries) {
        if (entry.cert_type == cert_type) {
            return &entry;
        }
    }
    return nullptr;
}

const Ed25519Cert* find_ed25519_cert(std::span<const CertEntry> entries, CertType cert_type) {
    for (const auto& entry : entries) {
        if (entry.cert_type == static_cast<uint8_t>(cert_type)) {
            if (const auto* cert = entry.as_ed25519()) {
                return cert;
            }
        }
    }
    return nullptr;
}

// --- CertsCodec ---

util::Result<CertsCell> CertsCodec::from_cell(const core::Cell& cell) const {
    TORLINK_TRY_VOID(expect_command(cell, core::CellCommand::CERTS));
    auto certs = TORLINK_TRY(parse_cert_list(cell.payload_span()));
    return CertsCell{std::move(certs)};
}

util::Result<CertsCell> CertsCodec::from_params(const CertsParams&) const {
    return std::unexpected(util::Error::not_implemented("building CERTS cells"));
}

util::Result<core::Cell> CertsCodec::to_cell(const CertsCell&) const {
    return std::unexpected(util::Error::not_implemented("encoding CERTS cells"));
}

}  // namespace torlink::protocol
