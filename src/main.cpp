#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "torlink/core/channel.hpp"
#include "torlink/crypto/hash.hpp"
#include "torlink/net/connection.hpp"
#include "torlink/protocol/link_protocol.hpp"
#include "torlink/util/config.hpp"
#include "torlink/util/logging.hpp"

namespace {

const char* cert_type_name(uint8_t type) {
    switch (static_cast<torlink::protocol::CertType>(type)) {
        case torlink::protocol::CertType::Link: return "LINK";
        case torlink::protocol::CertType::RsaIdentity: return "RSA_IDENTITY";
        case torlink::protocol::CertType::RsaAuthenticate: return "RSA_AUTHENTICATE";
        case torlink::protocol::CertType::IdentityV1Signing: return "IDENTITY_V_SIGNING";
        case torlink::protocol::CertType::SigningV1TlsCert: return "SIGNING_V_TLS_CERT";
        case torlink::protocol::CertType::SigningV1Authenticate: return "SIGNING_V_AUTH";
        case torlink::protocol::CertType::RsaCrosscert: return "RSA_ED_CROSSCERT";
        case torlink::protocol::CertType::SigningV1ReducedLink: return "SIGNING_V_LINK";
        case torlink::protocol::CertType::Ntor: return "NTOR_CC";
        case torlink::protocol::CertType::NtorCrosscert: return "NTOR_ED_CROSSCERT";
        case torlink::protocol::CertType::SigningHsDescriptor: return "HS_SIGNING";
        default: return "UNKNOWN";
    }
}

void log_certificates(const std::vector<torlink::protocol::CertEntry>& certs) {
    for (const auto& entry : certs) {
        if (const auto* ed = entry.as_ed25519()) {
            LOG_INFO("  [{}] {} Ed25519: key {} expires at hour {}, {} extension(s)",
                     entry.cert_type, cert_type_name(entry.cert_type),
                     torlink::crypto::to_hex(ed->certified_key),
                     ed->expiration_date, ed->extensions.size());
            if (auto signer = ed->signing_key()) {
                LOG_INFO("      signed by {}", torlink::crypto::to_hex(*signer));
            }
        } else {
            const auto& opaque = std::get<torlink::protocol::OpaqueCert>(entry.body);
            LOG_INFO("  [{}] {} ({} bytes)",
                     entry.cert_type, cert_type_name(entry.cert_type), opaque.body.size());
        }
    }
}

torlink::util::Result<torlink::util::Config> create_config(const torlink::util::CliArgs& args) {
    torlink::util::Config config = torlink::util::default_config();

    if (args.config_file) {
        config = TORLINK_TRY(torlink::util::Config::load_from_file(*args.config_file));
    }

    config.apply_cli_args(args);
    TORLINK_TRY_VOID(config.validate());
    return config;
}

int run_link_check(const torlink::util::Config& config) {
    LOG_INFO("Connecting to {}:{}", config.relay.address, config.relay.port);

    auto transport = torlink::net::TlsTransport::connect(
        config.relay.address, config.relay.port, config.network);
    if (!transport) {
        LOG_ERROR("Connection failed: {}", transport.error().message());
        return 1;
    }
    LOG_INFO("TLS established: {} {}", (*transport)->tls_version(), (*transport)->cipher());

    torlink::core::Channel channel(std::move(*transport));

    torlink::protocol::LinkHandshake handshake(config.link.versions);
    auto result = handshake.run_as_client(channel);
    if (!result) {
        LOG_ERROR("Handshake failed ({}): {}",
                  torlink::util::error_code_name(result.error().code()),
                  result.error().message());
        channel.close();
        return 1;
    }

    LOG_INFO("Link protocol v{}; relay offered {} version(s)",
             handshake.negotiated_version(), handshake.peer_versions().size());
    LOG_INFO("Relay presented {} certificate(s):", handshake.peer_certs().size());
    log_certificates(handshake.peer_certs());

    if (const auto& netinfo = handshake.peer_netinfo()) {
        LOG_INFO("Relay sees us at {}", netinfo->other_address.to_string());
        for (const auto& addr : netinfo->my_addresses) {
            LOG_INFO("Relay address: {}", addr.to_string());
        }
    }

    LOG_INFO("Channel stats: {} cells / {} bytes sent, {} cells / {} bytes received",
             channel.cells_sent(), channel.bytes_sent(),
             channel.cells_received(), channel.bytes_received());

    channel.close();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);  // Ignore broken pipe

    auto args = torlink::util::parse_cli_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error().message() << "\n";
        torlink::util::print_usage(argv[0]);
        return 1;
    }

    if (args->help) {
        torlink::util::print_usage(argv[0]);
        return 0;
    }

    if (args->version) {
        torlink::util::print_version();
        return 0;
    }

    auto config = create_config(*args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << "\n";
        return 1;
    }

    torlink::util::configure_logging(config->logging);

    return run_link_check(*config);
}
