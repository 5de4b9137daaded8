#pragma once

#include "torlink/core/cell.hpp"
#include "torlink/core/channel.hpp"
#include "torlink/protocol/certs.hpp"
#include "torlink/protocol/netinfo.hpp"
#include "torlink/protocol/versions.hpp"
#include "torlink/util/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace torlink::protocol {

// Link protocol state machine
enum class LinkState {
    Initial,
    VersionsSent,
    VersionsReceived,
    CertsReceived,
    AuthChallengeReceived,
    NetinfoReceived,
    NetinfoSent,
    Open,
    Failed,
};

// Unauthenticated client side of the link handshake:
//   -> VERSIONS
//   <- VERSIONS, CERTS, AUTH_CHALLENGE, NETINFO
//   -> NETINFO
// PADDING and VPADDING cells after the VERSIONS exchange are skipped.
// The channel must use 16-bit circuit IDs; a negotiated version of 4 or
// more fails with ProtocolError since the width cannot change in-band.
class LinkHandshake {
public:
    explicit LinkHandshake(std::vector<uint16_t> versions = {3});

    // peer_address is the relay's IP as we see it; when empty the
    // channel's remote address is used
    [[nodiscard]] util::VoidResult run_as_client(
        core::Channel& channel, const std::string& peer_address = {});

    [[nodiscard]] LinkState state() const { return state_; }
    [[nodiscard]] bool is_open() const { return state_ == LinkState::Open; }

    [[nodiscard]] uint16_t negotiated_version() const { return negotiated_version_; }
    [[nodiscard]] const std::vector<uint16_t>& offered_versions() const { return versions_; }
    [[nodiscard]] const std::vector<uint16_t>& peer_versions() const { return peer_versions_; }
    [[nodiscard]] const std::vector<CertEntry>& peer_certs() const { return peer_certs_; }

    // Raw AUTH_CHALLENGE; never interpreted
    [[nodiscard]] const std::optional<core::Cell>& auth_challenge() const {
        return auth_challenge_;
    }

    [[nodiscard]] const std::optional<NetinfoCell>& peer_netinfo() const {
        return peer_netinfo_;
    }

private:
    [[nodiscard]] util::VoidResult exchange_versions(core::Channel& channel);
    [[nodiscard]] util::VoidResult receive_certs(core::Channel& channel);
    [[nodiscard]] util::VoidResult receive_auth_challenge(core::Channel& channel);
    [[nodiscard]] util::VoidResult exchange_netinfo(
        core::Channel& channel, const std::string& peer_address);

    // Next cell that is not PADDING or VPADDING
    [[nodiscard]] util::Result<core::Cell> receive_skipping_padding(core::Channel& channel);

    [[nodiscard]] util::Error fail(util::Error error);

    std::vector<uint16_t> versions_;
    VersionsCodec versions_codec_;
    CertsCodec certs_codec_;
    NetinfoCodec netinfo_codec_;

    LinkState state_{LinkState::Initial};
    uint16_t negotiated_version_{0};
    std::vector<uint16_t> peer_versions_;
    std::vector<CertEntry> peer_certs_;
    std::optional<core::Cell> auth_challenge_;
    std::optional<NetinfoCell> peer_netinfo_;
};

[[nodiscard]] const char* link_state_name(LinkState state);

}  // namespace torlink::protocol
