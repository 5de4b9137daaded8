#include "torlink/protocol/cell_codec.hpp"
#include "torlink/protocol/binary_io.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace torlink::protocol {

util::Result<std::vector<uint8_t>> CellCodec::encode(const core::Cell& cell) const {
    const size_t header_len = core::cell_header_len(width_);
    const auto& payload = cell.payload();

    BinaryWriter writer(header_len + core::VAR_LENGTH_FIELD_LEN +
                        std::max(payload.size(), core::PAYLOAD_LEN));

    if (width_ == core::CircuitIdWidth::Bits32) {
        writer.write_u32(cell.circuit_id());
    } else {
        if (cell.circuit_id() > std::numeric_limits<uint16_t>::max()) {
            return std::unexpected(util::Error::invalid_argument(
                std::format("circuit ID {} does not fit a 16-bit channel",
                            cell.circuit_id())));
        }
        writer.write_u16(static_cast<uint16_t>(cell.circuit_id()));
    }

    writer.write_u8(cell.command_byte());

    if (cell.is_variable_length()) {
        if (payload.size() > std::numeric_limits<uint16_t>::max()) {
            return std::unexpected(util::Error::invalid_argument(
                std::format("{} payload of {} bytes exceeds the length field",
                            core::cell_command_name(cell.command()), payload.size())));
        }
        writer.write_u16(static_cast<uint16_t>(payload.size()));
        writer.write_bytes(payload);
    } else {
        // Cell::create already bounds fixed payloads
        writer.write_bytes(payload);
        writer.write_padding(core::PAYLOAD_LEN - payload.size());
    }

    return writer.take();
}

util::VoidResult CellCodec::write(const core::Cell& cell, net::Transport& transport) const {
    auto bytes = TORLINK_TRY(encode(cell));
    return transport.send(bytes);
}

util::Result<core::Cell> CellCodec::read(net::Transport& transport) const {
    auto header = TORLINK_TRY(transport.recv_exact(core::cell_header_len(width_)));

    BinaryReader reader(header);
    core::CircuitId circuit_id = 0;
    if (width_ == core::CircuitIdWidth::Bits32) {
        circuit_id = TORLINK_TRY(reader.read_u32());
    } else {
        circuit_id = TORLINK_TRY(reader.read_u16());
    }
    uint8_t command = TORLINK_TRY(reader.read_u8());

    if (core::is_variable_length(command)) {
        auto length_bytes = TORLINK_TRY(transport.recv_exact(core::VAR_LENGTH_FIELD_LEN));
        BinaryReader length_reader(length_bytes);
        uint16_t length = TORLINK_TRY(length_reader.read_u16());

        std::vector<uint8_t> payload;
        if (length > 0) {
            payload = TORLINK_TRY(transport.recv_exact(length));
        }
        return core::Cell::create(circuit_id, command, std::move(payload));
    }

    auto payload = TORLINK_TRY(transport.recv_exact(core::PAYLOAD_LEN));
    auto last = std::find_if(payload.rbegin(), payload.rend(),
                             [](uint8_t byte) { return byte != 0; });
    payload.erase(last.base(), payload.end());
    return core::Cell::create(circuit_id, command, std::move(payload));
}

}  // namespace torlink::protocol
