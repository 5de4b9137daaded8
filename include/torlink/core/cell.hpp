#pragma once

#include "torlink/util/result.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace torlink::core {

// Cell constants
constexpr size_t PAYLOAD_LEN = 509;        // Fixed cell body size
constexpr size_t VAR_LENGTH_FIELD_LEN = 2; // u16 length prefix of variable cells
constexpr uint8_t FIRST_VARIABLE_COMMAND = 128;

using CircuitId = uint32_t;

// Circuit ID width in bits; fixed for the lifetime of a channel
enum class CircuitIdWidth : uint8_t {
    Bits16 = 16,
    Bits32 = 32,
};

[[nodiscard]] constexpr size_t circuit_id_len(CircuitIdWidth width) {
    return static_cast<size_t>(width) / 8;
}

// Bytes in a cell header (circuit ID + command)
[[nodiscard]] constexpr size_t cell_header_len(CircuitIdWidth width) {
    return circuit_id_len(width) + 1;
}

// Cell commands (tor-spec, "Cell packet format")
enum class CellCommand : uint8_t {
    PADDING           = 0,
    CREATE            = 1,
    CREATED           = 2,
    RELAY             = 3,
    DESTROY           = 4,
    CREATE_FAST       = 5,
    CREATED_FAST      = 6,
    VERSIONS          = 7,    // Variable length despite being < 128
    NETINFO           = 8,
    RELAY_EARLY       = 9,
    CREATE2           = 10,
    CREATED2          = 11,
    PADDING_NEGOTIATE = 12,

    // Variable-length commands (128+)
    VPADDING          = 128,
    CERTS             = 129,
    AUTH_CHALLENGE    = 130,
    AUTHENTICATE      = 131,
    AUTHORIZE         = 132,
};

// True iff the command uses the variable-length framing.
// The one predicate shared by the encode and decode paths.
[[nodiscard]] constexpr bool is_variable_length(uint8_t command) {
    return command >= FIRST_VARIABLE_COMMAND ||
           command == static_cast<uint8_t>(CellCommand::VERSIONS);
}

[[nodiscard]] constexpr bool is_variable_length(CellCommand command) {
    return is_variable_length(static_cast<uint8_t>(command));
}

// A framed link-layer message. Immutable once built.
class Cell {
public:
    // Fails with InvalidArgument when a fixed-length command carries
    // more than PAYLOAD_LEN bytes
    [[nodiscard]] static util::Result<Cell> create(
        CircuitId circuit_id, CellCommand command, std::vector<uint8_t> payload);

    [[nodiscard]] static util::Result<Cell> create(
        CircuitId circuit_id, uint8_t command, std::vector<uint8_t> payload) {
        return create(circuit_id, static_cast<CellCommand>(command), std::move(payload));
    }

    [[nodiscard]] CircuitId circuit_id() const { return circuit_id_; }
    [[nodiscard]] CellCommand command() const { return command_; }
    [[nodiscard]] uint8_t command_byte() const { return static_cast<uint8_t>(command_); }
    [[nodiscard]] const std::vector<uint8_t>& payload() const { return payload_; }
    [[nodiscard]] std::span<const uint8_t> payload_span() const { return payload_; }

    [[nodiscard]] bool is_variable_length() const {
        return core::is_variable_length(command_);
    }

    // Moves the payload out; the cell is consumed
    [[nodiscard]] std::vector<uint8_t> take_payload() && { return std::move(payload_); }

    bool operator==(const Cell&) const = default;

private:
    Cell(CircuitId circuit_id, CellCommand command, std::vector<uint8_t> payload)
        : circuit_id_(circuit_id), command_(command), payload_(std::move(payload)) {}

    CircuitId circuit_id_{0};
    CellCommand command_{CellCommand::PADDING};
    std::vector<uint8_t> payload_;
};

// Command name for logging
[[nodiscard]] const char* cell_command_name(CellCommand cmd);

}  // namespace torlink::core
