#include <catch2/catch_all.hpp>
#include "torlink/protocol/ed25519_cert.hpp"
#include "../fixtures/cell_fixtures.hpp"

using namespace torlink;
using namespace torlink::protocol;
using namespace torlink::test::fixtures;

TEST_CASE("Ed25519 certificate parsing", "[certs][ed25519][unit]") {
    SECTION("Minimal 104-byte certificate") {
        auto key = sequential_key();
        auto body = ed25519_cert_body(5, key);
        REQUIRE(body.size() == 104);

        auto cert = parse_ed25519_cert(body, 5);
        REQUIRE(cert.has_value());
        CHECK(cert->cert_type == 5);
        CHECK(cert->format_version == 1);
        CHECK(cert->expiration_date == 480000);
        CHECK(cert->cert_key_type == 1);
        CHECK(cert->certified_key == key);
        CHECK(cert->extensions.empty());

        CHECK(cert->pre_signature_bytes ==
              std::vector<uint8_t>(body.begin(), body.begin() + 40));
        CHECK(std::vector<uint8_t>(cert->signature.begin(), cert->signature.end()) ==
              std::vector<uint8_t>(body.end() - 64, body.end()));
    }

    SECTION("Extensions are parsed in order") {
        auto signer = sequential_key(0x40);
        std::vector<ExtensionSpec> extensions = {
            {EXT_SIGNED_WITH_ED25519_KEY, 0x00,
             std::vector<uint8_t>(signer.begin(), signer.end())},
            {0x07, EXT_FLAG_AFFECTS_VALIDATION, {0xDE, 0xAD}},
        };
        auto body = ed25519_cert_body(4, sequential_key(), extensions);

        auto cert = parse_ed25519_cert(body, 4);
        REQUIRE(cert.has_value());
        REQUIRE(cert->extensions.size() == 2);
        CHECK(cert->extensions[0].ext_type == EXT_SIGNED_WITH_ED25519_KEY);
        CHECK(cert->extensions[0].ext_data.size() == 32);
        CHECK(cert->extensions[1].ext_type == 0x07);
        CHECK(cert->extensions[1].ext_flags == EXT_FLAG_AFFECTS_VALIDATION);
        CHECK(cert->extensions[1].ext_data == std::vector<uint8_t>{0xDE, 0xAD});

        CHECK(cert->pre_signature_bytes.size() == body.size() - 64);

        auto key = cert->signing_key();
        REQUIRE(key.has_value());
        CHECK(*key == signer);
    }

    SECTION("Signing key is absent without the extension") {
        auto cert = parse_ed25519_cert(ed25519_cert_body(5, sequential_key()), 5);
        REQUIRE(cert.has_value());
        CHECK_FALSE(cert->signing_key().has_value());
    }

    SECTION("Outer tag wins over the embedded type") {
        auto body = ed25519_cert_body(4, sequential_key());
        auto cert = parse_ed25519_cert(body, 5);

        REQUIRE(cert.has_value());
        CHECK(cert->cert_type == 5);
        CHECK(cert->embedded_cert_type == 4);
    }

    SECTION("Expiration converts from hours") {
        auto cert = parse_ed25519_cert(ed25519_cert_body(5, sequential_key(), {}, 24), 5);
        REQUIRE(cert.has_value());

        auto since_epoch = cert->expiration_time().time_since_epoch();
        CHECK(std::chrono::duration_cast<std::chrono::hours>(since_epoch).count() == 24);
        CHECK(cert->is_expired(std::chrono::system_clock::now()));
    }
}

TEST_CASE("Ed25519 certificate rejection", "[certs][ed25519][unit]") {
    SECTION("Shorter than header plus signature") {
        std::vector<uint8_t> body(103, 0x01);
        auto cert = parse_ed25519_cert(body, 5);

        REQUIRE_FALSE(cert.has_value());
        CHECK(cert.error().code() == util::Error::Code::InvalidFormat);
    }

    SECTION("Extra byte after the signature") {
        auto body = ed25519_cert_body(5, sequential_key());
        body.push_back(0x00);
        auto cert = parse_ed25519_cert(body, 5);

        REQUIRE_FALSE(cert.has_value());
        CHECK(cert.error().code() == util::Error::Code::InvalidFormat);
    }

    SECTION("Declared extension missing") {
        auto body = ed25519_cert_body(5, sequential_key());
        body[39] = 1;  // n_extensions
        auto cert = parse_ed25519_cert(body, 5);

        REQUIRE_FALSE(cert.has_value());
        CHECK(cert.error().code() == util::Error::Code::InvalidFormat);
    }

    SECTION("Extension length runs past the end") {
        auto body = ed25519_cert_body(5, sequential_key(), {{0x07, 0x00, {0x01}}});
        body[40] = 0xFF;  // ext_len high byte
        auto cert = parse_ed25519_cert(body, 5);

        REQUIRE_FALSE(cert.has_value());
        CHECK(cert.error().code() == util::Error::Code::InvalidFormat);
    }
}
