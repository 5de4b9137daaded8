#include <catch2/catch_all.hpp>
#include "torlink/util/config.hpp"
#include <array>

using namespace torlink::util;

TEST_CASE("Default config", "[config][unit]") {
    auto config = default_config();

    SECTION("Has sensible defaults") {
        CHECK(config.relay.address.empty());
        CHECK(config.relay.port == 443);
        CHECK(config.link.versions == std::vector<uint16_t>{3});
        CHECK(config.network.connect_timeout == std::chrono::milliseconds(30000));
        CHECK(config.logging.level == "info");
        CHECK(config.logging.log_to_console);
    }

    SECTION("Needs an address to validate") {
        auto result = config.validate();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == Error::Code::ConfigError);
    }
}

TEST_CASE("Config from TOML", "[config][unit]") {
    SECTION("All sections") {
        auto config = Config::load_from_string(R"(
[relay]
address = "198.51.100.7"   # a relay
port = 9001

[link]
versions = "1, 2, 3"

[network]
connect_timeout_ms = 5000
read_timeout_ms = 7000

[logging]
level = "debug"
file = "/tmp/torlink.log"
console = false
)");

        REQUIRE(config.has_value());
        CHECK(config->relay.address == "198.51.100.7");
        CHECK(config->relay.port == 9001);
        CHECK(config->link.versions == std::vector<uint16_t>{1, 2, 3});
        CHECK(config->network.connect_timeout == std::chrono::milliseconds(5000));
        CHECK(config->network.read_timeout == std::chrono::milliseconds(7000));
        CHECK(config->logging.level == "debug");
        CHECK(config->logging.log_file == "/tmp/torlink.log");
        CHECK_FALSE(config->logging.log_to_console);
        CHECK(config->validate().has_value());
    }

    SECTION("Missing keys keep their defaults") {
        auto config = Config::load_from_string("[relay]\naddress = \"10.0.0.1\"\n");
        REQUIRE(config.has_value());
        CHECK(config->relay.port == 443);
        CHECK(config->link.versions == std::vector<uint16_t>{3});
    }

    SECTION("Example config loads and validates") {
        auto config = Config::load_from_string(example_config_toml());
        REQUIRE(config.has_value());
        CHECK(config->validate().has_value());
    }

    SECTION("Round trip through to_toml") {
        auto original = default_config();
        original.relay.address = "192.0.2.1";
        original.link.versions = {2, 3};
        original.logging.log_file = "torlink.log";

        auto reloaded = Config::load_from_string(original.to_toml());
        REQUIRE(reloaded.has_value());
        CHECK(reloaded->relay.address == "192.0.2.1");
        CHECK(reloaded->link.versions == std::vector<uint16_t>{2, 3});
        CHECK(reloaded->logging.log_file == "torlink.log");
    }
}

TEST_CASE("Config rejection", "[config][unit]") {
    SECTION("Line without '='") {
        auto config = Config::load_from_string("[relay]\naddress\n");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == Error::Code::ConfigError);
    }

    SECTION("Unterminated section") {
        auto config = Config::load_from_string("[relay\n");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == Error::Code::ConfigError);
    }

    SECTION("Port is not a number") {
        auto config = Config::load_from_string("[relay]\nport = https\n");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == Error::Code::ConfigError);
    }

    SECTION("Bad boolean") {
        auto config = Config::load_from_string("[logging]\nconsole = maybe\n");
        REQUIRE_FALSE(config.has_value());
    }

    SECTION("Missing file") {
        auto config = Config::load_from_file("/nonexistent/torlink.toml");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == Error::Code::ConfigError);
    }

    SECTION("Validation") {
        auto config = default_config();
        config.relay.address = "127.0.0.1";
        REQUIRE(config.validate().has_value());

        auto bad_version = config;
        bad_version.link.versions = {3, 6};
        CHECK_FALSE(bad_version.validate().has_value());

        auto zero_version = config;
        zero_version.link.versions = {0};
        CHECK_FALSE(zero_version.validate().has_value());

        auto no_versions = config;
        no_versions.link.versions.clear();
        CHECK_FALSE(no_versions.validate().has_value());

        auto bad_level = config;
        bad_level.logging.level = "loud";
        CHECK_FALSE(bad_level.validate().has_value());

        auto zero_port = config;
        zero_port.relay.port = 0;
        CHECK_FALSE(zero_port.validate().has_value());
    }
}

TEST_CASE("Offered versions stay on 16-bit circuit IDs", "[config][unit]") {
    auto config = Config::load_from_string("[relay]\naddress = \"192.0.2.1\"\n"
                                           "[link]\nversions = \"3,4\"\n");
    REQUIRE(config.has_value());

    auto result = config->validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::ConfigError);

    config->link.versions = {5};
    CHECK_FALSE(config->validate().has_value());

    config->link.versions = {3};
    CHECK(config->validate().has_value());
}

TEST_CASE("Version list parsing", "[config][unit]") {
    auto versions = parse_version_list("3,4, 5");
    REQUIRE(versions.has_value());
    CHECK(*versions == std::vector<uint16_t>{3, 4, 5});

    CHECK_FALSE(parse_version_list("3,,4").has_value());
    CHECK_FALSE(parse_version_list("three").has_value());
}

TEST_CASE("CLI argument parsing", "[config][cli][unit]") {
    SECTION("Address, port and level") {
        std::array<const char*, 7> argv = {"torlink-probe", "-a", "192.0.2.9",
                                           "--port", "9001", "-l", "debug"};
        auto args = parse_cli_args(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));

        REQUIRE(args.has_value());
        CHECK(args->address == "192.0.2.9");
        CHECK(args->port == 9001);
        CHECK(args->log_level == "debug");
        CHECK_FALSE(args->help);

        auto config = default_config();
        config.apply_cli_args(*args);
        CHECK(config.relay.address == "192.0.2.9");
        CHECK(config.relay.port == 9001);
        CHECK(config.logging.level == "debug");
    }

    SECTION("Help stops parsing") {
        std::array<const char*, 3> argv = {"torlink-probe", "--help", "--bogus"};
        auto args = parse_cli_args(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));
        REQUIRE(args.has_value());
        CHECK(args->help);
    }

    SECTION("Invalid input") {
        std::array<const char*, 3> zero_port = {"torlink-probe", "-p", "0"};
        auto r1 = parse_cli_args(3, const_cast<char**>(zero_port.data()));
        REQUIRE_FALSE(r1.has_value());
        CHECK(r1.error().code() == Error::Code::InvalidArgument);

        std::array<const char*, 2> missing = {"torlink-probe", "--address"};
        CHECK_FALSE(parse_cli_args(2, const_cast<char**>(missing.data())).has_value());

        std::array<const char*, 3> unknown = {"torlink-probe", "--mode", "exit"};
        CHECK_FALSE(parse_cli_args(3, const_cast<char**>(unknown.data())).has_value());

        std::array<const char*, 3> level = {"torlink-probe", "-l", "verbose"};
        CHECK_FALSE(parse_cli_args(3, const_cast<char**>(level.data())).has_value());
    }
}
