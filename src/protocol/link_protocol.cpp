#include "torlink/protocol/link_protocol.hpp"
#include "torlink/util/logging.hpp"
#include <format>

namespace torlink::protocol {

LinkHandshake::LinkHandshake(std::vector<uint16_t> versions)
    : versions_(std::move(versions)) {}

util::Error LinkHandshake::fail(util::Error error) {
    LOG_WARN("Link handshake failed in state {}: {}",
             link_state_name(state_), error.message());
    state_ = LinkState::Failed;
    return error;
}

util::VoidResult LinkHandshake::run_as_client(
    core::Channel& channel, const std::string& peer_address) {
    state_ = LinkState::Initial;

    // VERSIONS always travels with a 2-byte circuit ID
    if (channel.circuit_id_width() != core::CircuitIdWidth::Bits16) {
        return std::unexpected(fail(util::Error::protocol_error(
            "link handshake needs a channel with 16-bit circuit IDs")));
    }

    if (auto r = exchange_versions(channel); !r) {
        return std::unexpected(fail(r.error()));
    }
    if (auto r = receive_certs(channel); !r) {
        return std::unexpected(fail(r.error()));
    }
    if (auto r = receive_auth_challenge(channel); !r) {
        return std::unexpected(fail(r.error()));
    }
    if (auto r = exchange_netinfo(channel, peer_address); !r) {
        return std::unexpected(fail(r.error()));
    }

    state_ = LinkState::Open;
    LOG_INFO("Link to {} open, protocol v{}", channel.remote_address(), negotiated_version_);
    return util::unit;
}

util::VoidResult LinkHandshake::exchange_versions(core::Channel& channel) {
    auto ours = TORLINK_TRY(versions_codec_.from_params(versions_));
    TORLINK_TRY_VOID(channel.send_typed(ours, versions_codec_));
    state_ = LinkState::VersionsSent;
    LOG_DEBUG("Sent VERSIONS offering {} version(s)", ours.versions.size());

    auto theirs = TORLINK_TRY(channel.receive_typed(versions_codec_));
    peer_versions_ = theirs.versions;
    state_ = LinkState::VersionsReceived;

    negotiated_version_ = TORLINK_TRY(negotiate_version(versions_, peer_versions_));

    // Versions 4+ use 32-bit circuit IDs; the channel width cannot change
    if (negotiated_version_ >= 4) {
        return std::unexpected(util::Error::protocol_error(
            std::format("negotiated link v{} needs 32-bit circuit IDs, channel uses 16",
                        negotiated_version_)));
    }

    channel.set_link_version(negotiated_version_);
    LOG_DEBUG("Negotiated link protocol v{}", negotiated_version_);
    return util::unit;
}

util::VoidResult LinkHandshake::receive_certs(core::Channel& channel) {
    auto cell = TORLINK_TRY(receive_skipping_padding(channel));
    auto certs = TORLINK_TRY(certs_codec_.from_cell(cell));
    peer_certs_ = std::move(certs.certs);
    state_ = LinkState::CertsReceived;
    LOG_DEBUG("Received CERTS with {} certificate(s)", peer_certs_.size());

    const auto* signing_cert = find_ed25519_cert(peer_certs_, CertType::SigningV1TlsCert);
    if (!signing_cert) {
        return std::unexpected(util::Error::protocol_error(
            "CERTS carries no SIGNING_V_TLS_CERT (type 5)"));
    }

    return channel.verify_peer_identity(*signing_cert);
}

util::VoidResult LinkHandshake::receive_auth_challenge(core::Channel& channel) {
    auto cell = TORLINK_TRY(receive_skipping_padding(channel));
    if (cell.command() != core::CellCommand::AUTH_CHALLENGE) {
        return std::unexpected(util::Error::unexpected_command(
            std::format("expected AUTH_CHALLENGE cell, got {} ({})",
                        core::cell_command_name(cell.command()), cell.command_byte())));
    }

    auth_challenge_ = std::move(cell);
    state_ = LinkState::AuthChallengeReceived;
    return util::unit;
}

util::VoidResult LinkHandshake::exchange_netinfo(
    core::Channel& channel, const std::string& peer_address) {
    auto cell = TORLINK_TRY(receive_skipping_padding(channel));
    peer_netinfo_ = TORLINK_TRY(netinfo_codec_.from_cell(cell));
    state_ = LinkState::NetinfoReceived;
    LOG_DEBUG("Peer NETINFO: timestamp {}, sees us at {}",
              peer_netinfo_->timestamp, peer_netinfo_->other_address.to_string());

    NetinfoParams params;
    params.timestamp = 0;
    params.peer_address = peer_address.empty() ? channel.remote_address() : peer_address;
    params.my_addresses = {"0.0.0.0"};

    auto ours = TORLINK_TRY(netinfo_codec_.from_params(params));
    TORLINK_TRY_VOID(channel.send_typed(ours, netinfo_codec_));
    state_ = LinkState::NetinfoSent;
    return util::unit;
}

util::Result<core::Cell> LinkHandshake::receive_skipping_padding(core::Channel& channel) {
    for (;;) {
        auto cell = TORLINK_TRY(channel.receive());
        if (cell.command() == core::CellCommand::PADDING ||
            cell.command() == core::CellCommand::VPADDING) {
            LOG_TRACE("Skipping {} cell", core::cell_command_name(cell.command()));
            continue;
        }
        return cell;
    }
}

const char* link_state_name(LinkState state) {
    switch (state) {
        case LinkState::Initial:               return "Initial";
        case LinkState::VersionsSent:          return "VersionsSent";
        case LinkState::VersionsReceived:      return "VersionsReceived";
        case LinkState::CertsReceived:         return "CertsReceived";
        case LinkState::AuthChallengeReceived: return "AuthChallengeReceived";
        case LinkState::NetinfoReceived:       return "NetinfoReceived";
        case LinkState::NetinfoSent:           return "NetinfoSent";
        case LinkState::Open:                  return "Open";
        case LinkState::Failed:                return "Failed";
        default:                               return "Unknown";
    }
}

}  // namespace torlink::protocol
