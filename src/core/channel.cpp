#include "torlink/core/channel.hpp"
#include "torlink/crypto/hash.hpp"
#include "torlink/util/logging.hpp"
#include <format>

namespace torlink::core {

namespace {

// Bytes a cell occupies on the wire
size_t wire_size(const Cell& cell, CircuitIdWidth width) {
    size_t header = cell_header_len(width);
    if (cell.is_variable_length()) {
        return header + VAR_LENGTH_FIELD_LEN + cell.payload().size();
    }
    return header + PAYLOAD_LEN;
}

util::Error closed_error(const char* operation) {
    return util::Error(util::Error::Code::ConnectionClosed,
                       std::format("{} on closed channel", operation));
}

}  // namespace

Channel::Channel(std::unique_ptr<net::Transport> transport, CircuitIdWidth width)
    : transport_(std::move(transport))
    , codec_(width)
    , created_at_(std::chrono::steady_clock::now()) {}

Channel::Channel(Channel&& other) noexcept
    : transport_(std::move(other.transport_))
    , codec_(other.codec_)
    , state_(other.state_)
    , link_version_(other.link_version_)
    , cells_sent_(other.cells_sent_)
    , cells_received_(other.cells_received_)
    , bytes_sent_(other.bytes_sent_)
    , bytes_received_(other.bytes_received_)
    , created_at_(other.created_at_) {
    other.state_ = ChannelState::Closed;
}

Channel& Channel::operator=(Channel&& other) noexcept {
    if (this != &other) {
        close();
        transport_ = std::move(other.transport_);
        codec_ = other.codec_;
        state_ = other.state_;
        link_version_ = other.link_version_;
        cells_sent_ = other.cells_sent_;
        cells_received_ = other.cells_received_;
        bytes_sent_ = other.bytes_sent_;
        bytes_received_ = other.bytes_received_;
        created_at_ = other.created_at_;
        other.state_ = ChannelState::Closed;
    }
    return *this;
}

util::VoidResult Channel::send(const Cell& cell) {
    if (!is_open()) {
        return std::unexpected(closed_error("send"));
    }

    TORLINK_TRY_VOID(codec_.write(cell, *transport_));

    ++cells_sent_;
    bytes_sent_ += wire_size(cell, codec_.width());
    LOG_TRACE("Sent {} cell on circuit {} ({} byte payload)",
              cell_command_name(cell.command()), cell.circuit_id(), cell.payload().size());
    return util::unit;
}

util::Result<Cell> Channel::receive() {
    if (!is_open()) {
        return std::unexpected(closed_error("receive"));
    }

    auto cell = TORLINK_TRY(codec_.read(*transport_));

    ++cells_received_;
    bytes_received_ += wire_size(cell, codec_.width());
    LOG_TRACE("Received {} cell on circuit {} ({} byte payload)",
              cell_command_name(cell.command()), cell.circuit_id(), cell.payload().size());
    return cell;
}

util::VoidResult Channel::verify_peer_identity(const protocol::Ed25519Cert& signing_cert) const {
    if (signing_cert.cert_type != static_cast<uint8_t>(protocol::CertType::SigningV1TlsCert)) {
        return std::unexpected(util::Error::invalid_argument(
            std::format("identity check needs a type {} certificate, got type {}",
                        static_cast<int>(protocol::CertType::SigningV1TlsCert),
                        signing_cert.cert_type)));
    }

    if (!transport_) {
        return std::unexpected(closed_error("identity check"));
    }
    auto der = TORLINK_TRY(transport_->peer_certificate_der());

    auto digest = crypto::sha256(der);
    if (!digest) {
        return std::unexpected(util::Error::crypto_error(
            std::format("hashing peer certificate: {}",
                        crypto::hash_error_message(digest.error()))));
    }

    if (!crypto::constant_time_compare(*digest, signing_cert.certified_key)) {
        return std::unexpected(util::Error::cert_mismatch(
            std::format("peer TLS certificate digest {} is not the certified key {}",
                        crypto::to_hex(*digest), crypto::to_hex(signing_cert.certified_key))));
    }

    LOG_DEBUG("Peer TLS certificate matches SIGNING_V_TLS_CERT");
    return util::unit;
}

void Channel::close() {
    if (state_ == ChannelState::Closed) return;
    if (transport_) {
        transport_->close();
    }
    state_ = ChannelState::Closed;
}

const char* channel_state_name(ChannelState state) {
    switch (state) {
        case ChannelState::Open: return "Open";
        case ChannelState::Closed: return "Closed";
        default: return "Unknown";
    }
}

}  // namespace torlink::core
