#pragma once

#include "torlink/util/result.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace torlink::util {

// Relay to connect to
struct RelayConfig {
    std::string address;
    uint16_t port{443};
};

// Link protocol parameters
// Channels use 2-byte circuit IDs, so only versions 1-3 can be offered
struct LinkConfig {
    std::vector<uint16_t> versions{3};  // Offered in our VERSIONS cell
};

// Transport timeouts
struct NetworkConfig {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds read_timeout{30000};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string log_file;
    bool log_to_console{true};
};

// CLI argument parsing
struct CliArgs {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> address;
    std::optional<uint16_t> port;
    std::optional<std::string> log_level;
    bool help{false};
    bool version{false};
};

class Config {
public:
    Config() = default;

    // Load from TOML file
    [[nodiscard]] static Result<Config> load_from_file(const std::filesystem::path& path);

    // Load from TOML string
    [[nodiscard]] static Result<Config> load_from_string(const std::string& toml_content);

    [[nodiscard]] std::string to_toml() const;

    [[nodiscard]] VoidResult validate() const;

    // Command-line values win over file values
    void apply_cli_args(const CliArgs& args);

    RelayConfig relay;
    LinkConfig link;
    NetworkConfig network;
    LoggingConfig logging;
};

[[nodiscard]] Config default_config();

[[nodiscard]] std::string example_config_toml();

// Parse "3,4,5" into version numbers
[[nodiscard]] Result<std::vector<uint16_t>> parse_version_list(const std::string& text);

[[nodiscard]] Result<CliArgs> parse_cli_args(int argc, char* argv[]);

void print_usage(const char* program_name);
void print_version();

}  // namespace torlink::util
