#include "torlink/protocol/versions.hpp"
#include "torlink/protocol/binary_io.hpp"
#include <algorithm>
#include <format>

namespace torlink::protocol {

namespace {

bool is_known_version(uint16_t version) {
    return version >= LINK_PROTOCOL_MIN && version <= LINK_PROTOCOL_MAX;
}

}  // namespace

util::Result<VersionsCell> decode_versions(
    std::span<const uint8_t> payload, VersionsDecodeMode mode) {
    if (payload.size() % 2 != 0) {
        return std::unexpected(util::Error::invalid_format(
            std::format("VERSIONS payload has odd length {}", payload.size())));
    }

    BinaryReader reader(payload);
    VersionsCell cell;
    cell.versions.reserve(payload.size() / 2);

    while (!reader.at_end()) {
        uint16_t version = TORLINK_TRY(reader.read_u16());
        if (mode == VersionsDecodeMode::Strict && !is_known_version(version)) {
            return std::unexpected(util::Error::invalid_format(
                std::format("VERSIONS lists unknown version {}", version)));
        }
        cell.versions.push_back(version);
    }

    if (mode == VersionsDecodeMode::Strict && cell.versions.size() > MAX_PEER_VERSIONS) {
        return std::unexpected(util::Error::invalid_format(
            std::format("VERSIONS lists {} versions, at most {} allowed",
                        cell.versions.size(), MAX_PEER_VERSIONS)));
    }

    return cell;
}

util::Result<core::Cell> encode_versions(std::span<const uint16_t> versions) {
    BinaryWriter writer(versions.size() * 2);
    for (uint16_t version : versions) {
        if (!is_known_version(version)) {
            return std::unexpected(util::Error::invalid_version(
                std::format("link version {} outside [{}, {}]",
                            version, LINK_PROTOCOL_MIN, LINK_PROTOCOL_MAX)));
        }
        writer.write_u16(version);
    }
    return core::Cell::create(0, core::CellCommand::VERSIONS, writer.take());
}

util::Result<uint16_t> negotiate_version(
    std::span<const uint16_t> ours, std::span<const uint16_t> theirs) {
    uint16_t best = 0;
    for (uint16_t version : theirs) {
        if (version > best && std::ranges::find(ours, version) != ours.end()) {
            best = version;
        }
    }
    if (best == 0) {
        return std::unexpected(util::Error(util::Error::Code::VersionMismatch,
            "no link protocol version in common with peer"));
    }
    return best;
}

// --- VersionsCodec ---

util::Result<VersionsCell> VersionsCodec::from_cell(const core::Cell& cell) const {
    TORLINK_TRY_VOID(expect_command(cell, core::CellCommand::VERSIONS));
    return decode_versions(cell.payload_span(), VersionsDecodeMode::Strict);
}

util::Result<VersionsCell> VersionsCodec::from_params(
    const std::vector<uint16_t>& versions) const {
    for (uint16_t version : versions) {
        if (!is_known_version(version)) {
            return std::unexpected(util::Error::invalid_version(
                std::format("link version {} outside [{}, {}]",
                            version, LINK_PROTOCOL_MIN, LINK_PROTOCOL_MAX)));
        }
    }
    return VersionsCell{versions};
}

util::Result<core::Cell> VersionsCodec::to_cell(const VersionsCell& value) const {
    return encode_versions(value.versions);
}

}  // namespace torlink::protocol
