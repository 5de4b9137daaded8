#pragma once

#include "torlink/core/cell.hpp"
#include "torlink/util/result.hpp"
#include <format>

namespace torlink::protocol {

// Maps between a Cell and a typed value of one command.
// T is the decoded value, Params what an outbound value is built from.
template <typename T, typename Params>
class CellConverter {
public:
    using value_type = T;
    using params_type = Params;

    virtual ~CellConverter() = default;

    // Fails with UnexpectedCommand for a cell of another command
    [[nodiscard]] virtual util::Result<T> from_cell(const core::Cell& cell) const = 0;

    [[nodiscard]] virtual util::Result<T> from_params(const Params& params) const = 0;

    [[nodiscard]] virtual util::Result<core::Cell> to_cell(const T& value) const = 0;

protected:
    [[nodiscard]] static util::VoidResult expect_command(
        const core::Cell& cell, core::CellCommand expected) {
        if (cell.command() != expected) {
            return std::unexpected(util::Error::unexpected_command(
                std::format("expected {} cell, got {} ({})",
                            core::cell_command_name(expected),
                            core::cell_command_name(cell.command()),
                            cell.command_byte())));
        }
        return util::unit;
    }
};

}  // namespace torlink::protocol
