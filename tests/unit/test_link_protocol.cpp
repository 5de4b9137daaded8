#include <catch2/catch_all.hpp>
#include "torlink/core/channel.hpp"
#include "torlink/crypto/hash.hpp"
#include "torlink/protocol/link_protocol.hpp"
#include "../fixtures/cell_fixtures.hpp"
#include "../mocks/mock_network.hpp"
#include <algorithm>
#include <array>

using namespace torlink;
using namespace torlink::core;
using namespace torlink::protocol;
using namespace torlink::test;
using namespace torlink::test::fixtures;

namespace {

const std::vector<uint8_t> kPeerDer = {0x30, 0x82, 0x02, 0x11, 0x30, 0x82, 0x01, 0x79, 0xA0, 0x03};

std::array<uint8_t, 32> peer_digest() {
    auto digest = crypto::sha256(kPeerDer);
    REQUIRE(digest.has_value());
    return *digest;
}

std::vector<uint8_t> versions_payload(std::initializer_list<uint16_t> versions) {
    std::vector<uint8_t> payload;
    for (auto v : versions) {
        append_u16(payload, v);
    }
    return payload;
}

// Everything a relay sends after its VERSIONS cell
void script_relay_tail(MockSocket& socket, CircuitIdWidth width,
                       const std::array<uint8_t, 32>& signing_key) {
    socket.inject_cell(make_cell(0, CellCommand::CERTS, certs_payload({
        {2, std::vector<uint8_t>(96, 0x30)},
        {4, ed25519_cert_body(4, sequential_key(0x10))},
        {5, ed25519_cert_body(5, signing_key)},
    })), width);
    socket.inject_cell(make_cell(0, CellCommand::VPADDING, {0x00, 0x00, 0x00}), width);
    socket.inject_cell(make_cell(0, CellCommand::AUTH_CHALLENGE, auth_challenge_payload()), width);
    socket.inject_cell(make_cell(0, CellCommand::NETINFO, relay_netinfo_payload(1700000000)), width);
}

}  // namespace

TEST_CASE("Link handshake as client", "[link][handshake][unit]") {
    MockSocket socket;
    socket.set_peer_certificate(kPeerDer);
    Channel channel(std::make_unique<MockTransport>(socket));

    socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3})));
    script_relay_tail(socket, CircuitIdWidth::Bits16, peer_digest());

    LinkHandshake handshake;
    auto result = handshake.run_as_client(channel);

    REQUIRE(result.has_value());
    CHECK(handshake.state() == LinkState::Open);
    CHECK(handshake.is_open());
    CHECK(handshake.negotiated_version() == 3);
    CHECK(channel.link_version() == 3);
    CHECK(handshake.peer_versions() == std::vector<uint16_t>{3});
    CHECK(socket.buffered() == 0);

    SECTION("Peer certificates are kept in wire order") {
        REQUIRE(handshake.peer_certs().size() == 3);
        CHECK(handshake.peer_certs()[0].cert_type == 2);
        CHECK(handshake.peer_certs()[1].cert_type == 4);
        CHECK(handshake.peer_certs()[2].cert_type == 5);
    }

    SECTION("AUTH_CHALLENGE is stored raw") {
        REQUIRE(handshake.auth_challenge().has_value());
        CHECK(handshake.auth_challenge()->payload() == auth_challenge_payload());
    }

    SECTION("Peer NETINFO is decoded") {
        REQUIRE(handshake.peer_netinfo().has_value());
        CHECK(handshake.peer_netinfo()->timestamp == 1700000000);
        CHECK(handshake.peer_netinfo()->other_address.to_string() == "127.0.0.1");
    }

    SECTION("Client sends VERSIONS then NETINFO") {
        auto sent = socket.drain_sent_data();
        REQUIRE(sent.size() == 7 + 3 + PAYLOAD_LEN);

        std::vector<uint8_t> versions(sent.begin(), sent.begin() + 7);
        CHECK(versions == std::vector<uint8_t>{0x00, 0x00, 0x07, 0x00, 0x02, 0x00, 0x03});

        std::vector<uint8_t> netinfo_header(sent.begin() + 7, sent.begin() + 10);
        CHECK(netinfo_header == std::vector<uint8_t>{0x00, 0x00, 0x08});

        std::vector<uint8_t> netinfo_body(sent.begin() + 10, sent.begin() + 27);
        CHECK(netinfo_body == std::vector<uint8_t>{
            0x00, 0x00, 0x00, 0x00,
            0x04, 0x04, 127, 0, 0, 1,
            0x01,
            0x04, 0x04, 0, 0, 0, 0,
        });
        CHECK(std::all_of(sent.begin() + 27, sent.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("Link handshake with an explicit peer address", "[link][handshake][unit]") {
    MockSocket socket;
    socket.set_peer_certificate(kPeerDer);
    socket.set_remote_address("10.1.2.3");
    Channel channel(std::make_unique<MockTransport>(socket));

    socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({1, 2, 3})));
    script_relay_tail(socket, CircuitIdWidth::Bits16, peer_digest());

    LinkHandshake handshake;
    REQUIRE(handshake.run_as_client(channel, "192.0.2.44").has_value());

    auto sent = socket.drain_sent_data();
    REQUIRE(sent.size() >= 7 + 3 + 10);
    std::vector<uint8_t> other_address(sent.begin() + 14, sent.begin() + 20);
    CHECK(other_address == std::vector<uint8_t>{0x04, 0x04, 192, 0, 2, 44});
}

TEST_CASE("Link handshake refuses a 32-bit channel", "[link][handshake][unit]") {
    MockSocket socket;
    socket.set_peer_certificate(kPeerDer);
    Channel channel(std::make_unique<MockTransport>(socket), CircuitIdWidth::Bits32);

    socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3, 4, 5})),
                       CircuitIdWidth::Bits32);

    LinkHandshake handshake({3, 4});
    auto result = handshake.run_as_client(channel);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == util::Error::Code::ProtocolError);
    CHECK(handshake.state() == LinkState::Failed);
    CHECK(socket.send_calls() == 0);
    CHECK(socket.drain_sent_data().empty());
}

TEST_CASE("Link handshake failures", "[link][handshake][unit]") {
    MockSocket socket;
    socket.set_peer_certificate(kPeerDer);
    Channel channel(std::make_unique<MockTransport>(socket));

    SECTION("No common version") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({4, 5})));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::VersionMismatch);
        CHECK(handshake.state() == LinkState::Failed);
        CHECK(handshake.peer_versions() == std::vector<uint16_t>{4, 5});
    }

    SECTION("Version 4 on a 16-bit channel") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({4})));

        LinkHandshake handshake({3, 4});
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::ProtocolError);
        CHECK(handshake.state() == LinkState::Failed);
    }

    SECTION("Invalid offered version never reaches the wire") {
        LinkHandshake handshake({3, 9});
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::InvalidVersion);
        CHECK(socket.send_calls() == 0);
    }

    SECTION("Peer answers with something other than VERSIONS") {
        socket.inject_cell(make_cell(0, CellCommand::NETINFO, relay_netinfo_payload()));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::UnexpectedCommand);
    }

    SECTION("CERTS without a type 5 certificate") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3})));
        socket.inject_cell(make_cell(0, CellCommand::CERTS, certs_payload({
            {4, ed25519_cert_body(4, sequential_key())},
        })));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::ProtocolError);
        CHECK(handshake.peer_certs().size() == 1);
    }

    SECTION("Signing certificate does not match the TLS certificate") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3})));
        script_relay_tail(socket, CircuitIdWidth::Bits16, sequential_key(0x77));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::CertMismatch);
        CHECK(handshake.state() == LinkState::Failed);
        CHECK_FALSE(handshake.auth_challenge().has_value());
    }

    SECTION("NETINFO where AUTH_CHALLENGE belongs") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3})));
        socket.inject_cell(make_cell(0, CellCommand::CERTS, certs_payload({
            {5, ed25519_cert_body(5, peer_digest())},
        })));
        socket.inject_cell(make_cell(0, CellCommand::NETINFO, relay_netinfo_payload()));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::UnexpectedCommand);
    }

    SECTION("Peer closes after VERSIONS") {
        socket.inject_cell(make_cell(0, CellCommand::VERSIONS, versions_payload({3})));

        LinkHandshake handshake;
        auto result = handshake.run_as_client(channel);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == util::Error::Code::ConnectionClosed);
        CHECK(handshake.state() == LinkState::Failed);
    }
}

TEST_CASE("Link state names", "[link][unit]") {
    CHECK(std::string(link_state_name(LinkState::Initial)) == "Initial");
    CHECK(std::string(link_state_name(LinkState::AuthChallengeReceived)) == "AuthChallengeReceived");
    CHECK(std::string(link_state_name(LinkState::Open)) == "Open");
}
