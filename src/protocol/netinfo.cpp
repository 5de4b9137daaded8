#include "torlink/protocol/netinfo.hpp"
#include "torlink/crypto/hash.hpp"
#include "torlink/protocol/binary_io.hpp"
#include <boost/asio/ip/address.hpp>
#include <cstring>
#include <format>

namespace torlink::protocol {

namespace {

util::Result<NetinfoAddress> read_address(BinaryReader& reader) {
    NetinfoAddress addr;
    addr.type = TORLINK_TRY(reader.read_u8());
    uint8_t len = TORLINK_TRY(reader.read_u8());
    addr.bytes = TORLINK_TRY(reader.read_bytes(len));

    if ((addr.type == NETINFO_ADDR_IPV4 && len != 4) ||
        (addr.type == NETINFO_ADDR_IPV6 && len != 16)) {
        return std::unexpected(util::Error::invalid_format(
            std::format("NETINFO address of type {} has length {}", addr.type, len)));
    }
    return addr;
}

util::VoidResult write_address(BinaryWriter& writer, const NetinfoAddress& addr) {
    if (addr.bytes.size() > 0xFF) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("NETINFO address of {} bytes", addr.bytes.size())));
    }
    writer.write_u8(addr.type);
    writer.write_u8(static_cast<uint8_t>(addr.bytes.size()));
    writer.write_bytes(addr.bytes);
    return util::unit;
}

}  // namespace

util::Result<NetinfoAddress> NetinfoAddress::from_string(const std::string& address) {
    boost::system::error_code ec;
    auto parsed = boost::asio::ip::make_address(address, ec);
    if (ec) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("'{}' is not an IP address: {}", address, ec.message())));
    }

    NetinfoAddress out;
    if (parsed.is_v4()) {
        auto raw = parsed.to_v4().to_bytes();
        out.type = NETINFO_ADDR_IPV4;
        out.bytes.assign(raw.begin(), raw.end());
    } else {
        auto raw = parsed.to_v6().to_bytes();
        out.type = NETINFO_ADDR_IPV6;
        out.bytes.assign(raw.begin(), raw.end());
    }
    return out;
}

std::string NetinfoAddress::to_string() const {
    if (type == NETINFO_ADDR_IPV4 && bytes.size() == 4) {
        boost::asio::ip::address_v4::bytes_type raw{};
        std::memcpy(raw.data(), bytes.data(), raw.size());
        return boost::asio::ip::address_v4(raw).to_string();
    }
    if (type == NETINFO_ADDR_IPV6 && bytes.size() == 16) {
        boost::asio::ip::address_v6::bytes_type raw{};
        std::memcpy(raw.data(), bytes.data(), raw.size());
        return boost::asio::ip::address_v6(raw).to_string();
    }
    return std::format("type {}:{}", type, crypto::to_hex(bytes));
}

// --- NetinfoCodec ---

util::Result<NetinfoCell> NetinfoCodec::from_cell(const core::Cell& cell) const {
    TORLINK_TRY_VOID(expect_command(cell, core::CellCommand::NETINFO));

    // The fixed-cell decoder strips trailing zeros, which may have eaten
    // the tail of the last address; restore the full body first
    std::vector<uint8_t> body = cell.payload();
    if (body.size() < core::PAYLOAD_LEN) {
        body.resize(core::PAYLOAD_LEN, 0);
    }

    BinaryReader reader(body);
    NetinfoCell netinfo;
    netinfo.timestamp = TORLINK_TRY(reader.read_u32());
    netinfo.other_address = TORLINK_TRY(read_address(reader));

    uint8_t n_addresses = TORLINK_TRY(reader.read_u8());
    netinfo.my_addresses.reserve(n_addresses);
    for (uint8_t i = 0; i < n_addresses; ++i) {
        netinfo.my_addresses.push_back(TORLINK_TRY(read_address(reader)));
    }

    return netinfo;
}

util::Result<NetinfoCell> NetinfoCodec::from_params(const NetinfoParams& params) const {
    NetinfoCell netinfo;
    netinfo.timestamp = params.timestamp;
    netinfo.other_address = TORLINK_TRY(NetinfoAddress::from_string(params.peer_address));

    if (params.my_addresses.size() > 0xFF) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("{} local addresses, NETINFO holds at most 255",
                        params.my_addresses.size())));
    }
    for (const auto& address : params.my_addresses) {
        netinfo.my_addresses.push_back(TORLINK_TRY(NetinfoAddress::from_string(address)));
    }
    return netinfo;
}

util::Result<core::Cell> NetinfoCodec::to_cell(const NetinfoCell& value) const {
    if (value.my_addresses.size() > 0xFF) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("{} local addresses, NETINFO holds at most 255",
                        value.my_addresses.size())));
    }

    BinaryWriter writer(core::PAYLOAD_LEN);
    writer.write_u32(value.timestamp);
    TORLINK_TRY_VOID(write_address(writer, value.other_address));
    writer.write_u8(static_cast<uint8_t>(value.my_addresses.size()));
    for (const auto& addr : value.my_addresses) {
        TORLINK_TRY_VOID(write_address(writer, addr));
    }

    // Cell::create rejects a body over PAYLOAD_LEN
    return core::Cell::create(0, core::CellCommand::NETINFO, writer.take());
}

}  // namespace torlink::protocol
