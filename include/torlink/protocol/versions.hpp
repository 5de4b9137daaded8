#pragma once

#include "torlink/protocol/cell_converter.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace torlink::protocol {

// Link protocol versions this implementation can speak
constexpr uint16_t LINK_PROTOCOL_MIN = 1;
constexpr uint16_t LINK_PROTOCOL_MAX = 5;

// Most entries a peer may list in an inbound VERSIONS cell
constexpr size_t MAX_PEER_VERSIONS = 5;

struct VersionsCell {
    std::vector<uint16_t> versions;

    bool operator==(const VersionsCell&) const = default;
};

enum class VersionsDecodeMode {
    Strict,   // values in [1,5], at most five entries
    Lenient,  // only the even-length check
};

// Payload is a run of u16 big-endian versions with no prefix
[[nodiscard]] util::Result<VersionsCell> decode_versions(
    std::span<const uint8_t> payload,
    VersionsDecodeMode mode = VersionsDecodeMode::Strict);

// VERSIONS cell on circuit 0. Every value must lie in [1,5].
[[nodiscard]] util::Result<core::Cell> encode_versions(std::span<const uint16_t> versions);

// Highest version both sides list
[[nodiscard]] util::Result<uint16_t> negotiate_version(
    std::span<const uint16_t> ours, std::span<const uint16_t> theirs);

class VersionsCodec : public CellConverter<VersionsCell, std::vector<uint16_t>> {
public:
    [[nodiscard]] util::Result<VersionsCell> from_cell(const core::Cell& cell) const override;
    [[nodiscard]] util::Result<VersionsCell> from_params(
        const std::vector<uint16_t>& versions) const override;
    [[nodiscard]] util::Result<core::Cell> to_cell(const VersionsCell& value) const override;
};

}  // namespace torlink::protocol
