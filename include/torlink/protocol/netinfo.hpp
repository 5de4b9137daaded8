#pragma once

#include "torlink/protocol/cell_converter.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace torlink::protocol {

// NETINFO address types
constexpr uint8_t NETINFO_ADDR_IPV4 = 4;
constexpr uint8_t NETINFO_ADDR_IPV6 = 6;

// type (u8) | length (u8) | bytes
struct NetinfoAddress {
    uint8_t type{NETINFO_ADDR_IPV4};
    std::vector<uint8_t> bytes;

    // Textual IPv4 or IPv6 address; InvalidArgument if unparseable
    [[nodiscard]] static util::Result<NetinfoAddress> from_string(const std::string& address);

    // Dotted or colon form for known types, hex otherwise
    [[nodiscard]] std::string to_string() const;

    bool operator==(const NetinfoAddress&) const = default;
};

struct NetinfoCell {
    uint32_t timestamp{0};
    NetinfoAddress other_address;
    std::vector<NetinfoAddress> my_addresses;

    bool operator==(const NetinfoCell&) const = default;
};

struct NetinfoParams {
    uint32_t timestamp{0};
    std::string peer_address;
    std::vector<std::string> my_addresses;
};

class NetinfoCodec : public CellConverter<NetinfoCell, NetinfoParams> {
public:
    [[nodiscard]] util::Result<NetinfoCell> from_cell(const core::Cell& cell) const override;
    [[nodiscard]] util::Result<NetinfoCell> from_params(const NetinfoParams& params) const override;
    [[nodiscard]] util::Result<core::Cell> to_cell(const NetinfoCell& value) const override;
};

}  // namespace torlink::protocol
