#pragma once

#include "torlink/protocol/cell_converter.hpp"
#include "torlink/protocol/ed25519_cert.hpp"
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace torlink::protocol {

// Certificate body this parser does not interpret (RSA, X.509 and unknown tags)
struct OpaqueCert {
    uint8_t cert_type{0};
    std::vector<uint8_t> body;

    bool operator==(const OpaqueCert&) const = default;
};

struct CertEntry {
    uint8_t cert_type{0};
    std::variant<OpaqueCert, Ed25519Cert> body;

    [[nodiscard]] bool is_ed25519() const {
        return std::holds_alternative<Ed25519Cert>(body);
    }

    [[nodiscard]] const Ed25519Cert* as_ed25519() const {
        return std::get_if<Ed25519Cert>(&body);
    }

    bool operator==(const CertEntry&) const = default;
};

struct CertsCell {
    std::vector<CertEntry> certs;
};

// Not used: the client never sends CERTS
struct CertsParams {};

// Parse a CERTS payload: n_certs (u8), then n_certs of
// cert_type (u8) | cert_len (u16) | body. Entries keep wire order.
// Any malformed entry fails the whole list. Bytes after the last
// declared entry are ignored.
[[nodiscard]] util::Result<std::vector<CertEntry>> parse_cert_list(
    std::span<const uint8_t> payload);

[[nodiscard]] const CertEntry* find_cert(
    std::span<const CertEntry> entries, uint8_t cert_type);

[[nodiscard]] const Ed25519Cert* find_ed25519_cert(
    std::span<const CertEntry> entries, CertType cert_type);

class CertsCodec : public CellConverter<CertsCell, CertsParams> {
public:
    [[nodiscard]] util::Result<CertsCell> from_cell(const core::Cell& cell) const override;

    // NotImplemented
    [[nodiscard]] util::Result<CertsCell> from_params(const CertsParams& params) const override;

    // NotImplemented
    [[nodiscard]] util::Result<core::Cell> to_cell(const CertsCell& value) const override;
};

}  // namespace torlink::protocol
