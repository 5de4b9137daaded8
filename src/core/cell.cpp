#include "torlink/core/cell.hpp"
#include <format>

namespace torlink::core {

util::Result<Cell> Cell::create(
    CircuitId circuit_id, CellCommand command, std::vector<uint8_t> payload) {
    if (!core::is_variable_length(command) && payload.size() > PAYLOAD_LEN) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("{} cell payload is {} bytes, fixed cells hold at most {}",
                        cell_command_name(command), payload.size(), PAYLOAD_LEN)));
    }
    return Cell(circuit_id, command, std::move(payload));
}

const char* cell_command_name(CellCommand cmd) {
    switch (cmd) {
        case CellCommand::PADDING:           return "PADDING";
        case CellCommand::CREATE:            return "CREATE";
        case CellCommand::CREATED:           return "CREATED";
        case CellCommand::RELAY:             return "RELAY";
        case CellCommand::DESTROY:           return "DESTROY";
        case CellCommand::CREATE_FAST:       return "CREATE_FAST";
        case CellCommand::CREATED_FAST:      return "CREATED_FAST";
        case CellCommand::VERSIONS:          return "VERSIONS";
        case CellCommand::NETINFO:           return "NETINFO";
        case CellCommand::RELAY_EARLY:       return "RELAY_EARLY";
        case CellCommand::CREATE2:           return "CREATE2";
        case CellCommand::CREATED2:          return "CREATED2";
        case CellCommand::PADDING_NEGOTIATE: return "PADDING_NEGOTIATE";
        case CellCommand::VPADDING:          return "VPADDING";
        case CellCommand::CERTS:             return "CERTS";
        case CellCommand::AUTH_CHALLENGE:    return "AUTH_CHALLENGE";
        case CellCommand::AUTHENTICATE:      return "AUTHENTICATE";
        case CellCommand::AUTHORIZE:         return "AUTHORIZE";
        default:                             return "UNKNOWN";
    }
}

}  // namespace torlink::core
