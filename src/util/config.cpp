#include "torlink/util/config.hpp"
#include "torlink/util/logging.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace torlink::util {

// --- Minimal TOML reader (sections, key = value, comments) ---

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_comment(const std::string& s) {
    bool in_quotes = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') in_quotes = !in_quotes;
        if (s[i] == '#' && !in_quotes) return s.substr(0, i);
    }
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Flat key-value store: "section.key" -> "value"
using TomlMap = std::unordered_map<std::string, std::string>;

Result<TomlMap> parse_toml_simple(const std::string& content) {
    TomlMap result;
    std::string current_section;
    std::istringstream stream(content);
    std::string line;
    size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(strip_comment(line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return std::unexpected(Error::config_error(
                    std::format("line {}: unterminated section header", line_no)));
            }
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return std::unexpected(Error::config_error(
                std::format("line {}: expected key = value", line_no)));
        }

        auto key = trim(line.substr(0, eq));
        auto value = unquote(trim(line.substr(eq + 1)));

        std::string fqkey = current_section.empty() ? key : current_section + "." + key;
        result[fqkey] = value;
    }

    return result;
}

template <typename T>
Result<std::optional<T>> get_number(const TomlMap& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::optional<T>{};

    T value{};
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::unexpected(Error::config_error(
            std::format("{}: '{}' is not a valid number", key, text)));
    }
    return std::optional<T>{value};
}

Result<std::optional<bool>> get_bool(const TomlMap& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::optional<bool>{};
    if (it->second == "true" || it->second == "1") return std::optional<bool>{true};
    if (it->second == "false" || it->second == "0") return std::optional<bool>{false};
    return std::unexpected(Error::config_error(
        std::format("{}: '{}' is not a boolean", key, it->second)));
}

}  // namespace

Result<std::vector<uint16_t>> parse_version_list(const std::string& text) {
    std::vector<uint16_t> versions;
    std::istringstream stream(text);
    std::string item;

    while (std::getline(stream, item, ',')) {
        item = trim(item);
        uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
        if (item.empty() || ec != std::errc() || ptr != item.data() + item.size()) {
            return std::unexpected(Error::config_error(
                std::format("'{}' is not a link protocol version", item)));
        }
        versions.push_back(value);
    }

    return versions;
}

// --- Config ---

Result<Config> Config::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(Error::config_error(
            std::format("cannot open {}", path.string())));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Result<Config> Config::load_from_string(const std::string& toml_content) {
    Config config = default_config();
    auto m = TORLINK_TRY(parse_toml_simple(toml_content));

    // [relay]
    if (auto it = m.find("relay.address"); it != m.end()) {
        config.relay.address = it->second;
    }
    if (auto port = TORLINK_TRY(get_number<uint16_t>(m, "relay.port"))) {
        config.relay.port = *port;
    }

    // [link]
    if (auto it = m.find("link.versions"); it != m.end()) {
        config.link.versions = TORLINK_TRY(parse_version_list(it->second));
    }

    // [network]
    if (auto ms = TORLINK_TRY(get_number<uint32_t>(m, "network.connect_timeout_ms"))) {
        config.network.connect_timeout = std::chrono::milliseconds(*ms);
    }
    if (auto ms = TORLINK_TRY(get_number<uint32_t>(m, "network.read_timeout_ms"))) {
        config.network.read_timeout = std::chrono::milliseconds(*ms);
    }

    // [logging]
    if (auto it = m.find("logging.level"); it != m.end()) {
        config.logging.level = it->second;
    }
    if (auto it = m.find("logging.file"); it != m.end()) {
        config.logging.log_file = it->second;
    }
    if (auto console = TORLINK_TRY(get_bool(m, "logging.console"))) {
        config.logging.log_to_console = *console;
    }

    return config;
}

std::string Config::to_toml() const {
    std::ostringstream oss;
    oss << "[relay]\n";
    oss << "address = \"" << relay.address << "\"\n";
    oss << "port = " << relay.port << "\n\n";

    oss << "[link]\n";
    oss << "versions = \"";
    for (size_t i = 0; i < link.versions.size(); ++i) {
        if (i > 0) oss << ",";
        oss << link.versions[i];
    }
    oss << "\"\n\n";

    oss << "[network]\n";
    oss << "connect_timeout_ms = " << network.connect_timeout.count() << "\n";
    oss << "read_timeout_ms = " << network.read_timeout.count() << "\n\n";

    oss << "[logging]\n";
    oss << "level = \"" << logging.level << "\"\n";
    if (!logging.log_file.empty()) {
        oss << "file = \"" << logging.log_file << "\"\n";
    }
    oss << "console = " << (logging.log_to_console ? "true" : "false") << "\n";
    return oss.str();
}

VoidResult Config::validate() const {
    if (relay.address.empty()) {
        return std::unexpected(Error::config_error("relay.address is required"));
    }
    if (relay.port == 0) {
        return std::unexpected(Error::config_error("relay.port must be non-zero"));
    }
    if (link.versions.empty()) {
        return std::unexpected(Error::config_error("link.versions must not be empty"));
    }
    for (auto v : link.versions) {
        if (v < 1 || v > 3) {
            return std::unexpected(Error::config_error(
                std::format("link.versions: {} is outside [1,3]; versions 4+ need "
                            "32-bit circuit IDs", v)));
        }
    }
    if (!parse_log_level(logging.level)) {
        return std::unexpected(Error::config_error(
            std::format("logging.level: unknown level '{}'", logging.level)));
    }
    return unit;
}

void Config::apply_cli_args(const CliArgs& args) {
    if (args.address) relay.address = *args.address;
    if (args.port) relay.port = *args.port;
    if (args.log_level) logging.level = *args.log_level;
}

Config default_config() {
    Config config;
    config.relay.port = 443;
    config.link.versions = {3};
    return config;
}

std::string example_config_toml() {
    return R"(
# torlink-probe configuration

[relay]
address = "127.0.0.1"
port = 443

[link]
versions = "3"  # offered link protocol versions, 1-3

[network]
connect_timeout_ms = 30000
read_timeout_ms = 30000

[logging]
level = "info"
console = true
)";
}

Result<CliArgs> parse_cli_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (i + 1 >= argc) {
            return std::unexpected(Error::invalid_argument(
                std::format("option {} requires a value", arg)));
        }
        std::string value = argv[++i];

        if (arg == "-c" || arg == "--config") {
            args.config_file = value;
        } else if (arg == "-a" || arg == "--address") {
            args.address = value;
        } else if (arg == "-p" || arg == "--port") {
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (ec != std::errc() || ptr != value.data() + value.size() || port == 0) {
                return std::unexpected(Error::invalid_argument(
                    std::format("invalid port '{}'", value)));
            }
            args.port = port;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!parse_log_level(value)) {
                return std::unexpected(Error::invalid_argument(
                    std::format("invalid log level '{}'", value)));
            }
            args.log_level = value;
        } else {
            return std::unexpected(Error::invalid_argument(
                std::format("unknown option '{}'", arg)));
        }
    }

    return args;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Connects to a Tor relay, runs the link handshake and prints its certificates.\n\n"
              << "Options:\n"
              << "  -c, --config FILE     Configuration file path\n"
              << "  -a, --address HOST    Relay address\n"
              << "  -p, --port PORT       Relay OR port (default: 443)\n"
              << "  -l, --log-level LEVEL trace, debug, info, warn, error (default: info)\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n";
}

void print_version() {
    std::cout << "torlink-probe v0.1.0\n"
              << "Built with C++23, OpenSSL 3.x, Boost.Asio\n";
}

}  // namespace torlink::util
