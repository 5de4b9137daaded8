#pragma once

#include "torlink/core/cell.hpp"
#include "torlink/net/transport.hpp"
#include "torlink/protocol/cell_codec.hpp"
#include "torlink/protocol/cell_converter.hpp"
#include "torlink/protocol/ed25519_cert.hpp"
#include "torlink/util/result.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace torlink::core {

enum class ChannelState {
    Open,
    Closed,
};

// A link to one relay: a transport plus the framing for a fixed circuit ID
// width. Single-threaded; callers serialize access.
class Channel {
public:
    explicit Channel(std::unique_ptr<net::Transport> transport,
                     CircuitIdWidth width = CircuitIdWidth::Bits16);
    ~Channel() = default;

    // Non-copyable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    // A moved-from channel is Closed and has no transport
    Channel(Channel&& other) noexcept;
    Channel& operator=(Channel&& other) noexcept;

    [[nodiscard]] util::VoidResult send(const Cell& cell);

    // Blocks until a whole cell has been read
    [[nodiscard]] util::Result<Cell> receive();

    // Encode through the converter, then send. An encode failure never
    // reaches the transport.
    template <typename T, typename Params>
    [[nodiscard]] util::VoidResult send_typed(
        const T& value, const protocol::CellConverter<T, Params>& converter) {
        auto cell = TORLINK_TRY(converter.to_cell(value));
        return send(cell);
    }

    template <typename T, typename Params>
    [[nodiscard]] util::Result<T> receive_typed(
        const protocol::CellConverter<T, Params>& converter) {
        auto cell = TORLINK_TRY(receive());
        return converter.from_cell(cell);
    }

    // Check that the TLS certificate the peer presented is the one the
    // SIGNING_V_TLS_CERT (type 5) certifies: SHA-256 of its DER encoding
    // must equal certified_key. No chain, expiry or signature checks.
    [[nodiscard]] util::VoidResult verify_peer_identity(
        const protocol::Ed25519Cert& signing_cert) const;

    void close();

    [[nodiscard]] ChannelState state() const { return state_; }
    [[nodiscard]] bool is_open() const { return state_ == ChannelState::Open; }
    [[nodiscard]] CircuitIdWidth circuit_id_width() const { return codec_.width(); }

    [[nodiscard]] uint16_t link_version() const { return link_version_; }
    void set_link_version(uint16_t version) { link_version_ = version; }

    [[nodiscard]] std::string remote_address() const {
        return transport_ ? transport_->remote_address() : std::string{};
    }

    // Statistics
    [[nodiscard]] uint64_t cells_sent() const { return cells_sent_; }
    [[nodiscard]] uint64_t cells_received() const { return cells_received_; }
    [[nodiscard]] uint64_t bytes_sent() const { return bytes_sent_; }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }

    [[nodiscard]] std::chrono::steady_clock::time_point created_at() const { return created_at_; }

private:
    std::unique_ptr<net::Transport> transport_;
    protocol::CellCodec codec_;
    ChannelState state_{ChannelState::Open};
    uint16_t link_version_{0};

    uint64_t cells_sent_{0};
    uint64_t cells_received_{0};
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};

    std::chrono::steady_clock::time_point created_at_;
};

[[nodiscard]] const char* channel_state_name(ChannelState state);

}  // namespace torlink::core
