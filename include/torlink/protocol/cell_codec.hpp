#pragma once

#include "torlink/core/cell.hpp"
#include "torlink/net/transport.hpp"
#include "torlink/util/result.hpp"
#include <cstdint>
#include <vector>

namespace torlink::protocol {

// Frames cells onto and off a transport for one circuit ID width.
//
// Wire layout:
//   fixed:    circ_id | command | payload (zero padded to PAYLOAD_LEN)
//   variable: circ_id | command | length (u16) | payload
class CellCodec {
public:
    explicit CellCodec(core::CircuitIdWidth width = core::CircuitIdWidth::Bits16)
        : width_(width) {}

    [[nodiscard]] core::CircuitIdWidth width() const { return width_; }

    // Serialize a cell. Fails with InvalidArgument when the circuit ID does
    // not fit the width or a variable payload exceeds the u16 length field.
    [[nodiscard]] util::Result<std::vector<uint8_t>> encode(const core::Cell& cell) const;

    // Encode and hand the bytes to the transport in a single send
    [[nodiscard]] util::VoidResult write(const core::Cell& cell, net::Transport& transport) const;

    // Read exactly one cell. Fixed payloads come back with all trailing
    // zero bytes stripped, so a payload that ends in 0x00 is shortened.
    [[nodiscard]] util::Result<core::Cell> read(net::Transport& transport) const;

private:
    core::CircuitIdWidth width_;
};

}  // namespace torlink::protocol
