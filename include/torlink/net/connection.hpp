#pragma once

#include "torlink/crypto/tls.hpp"
#include "torlink/net/transport.hpp"
#include "torlink/util/config.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace torlink::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Connection state
enum class ConnectionState {
    Disconnected,
    Connecting,
    TlsHandshake,
    Ready,
    Closed,
    Error,
};

// TCP socket wrapped in an OpenSSL session
class TlsTransport : public Transport {
    // Restricts construction to connect() and accept()
    struct Token {
        explicit Token() = default;
    };

public:
    TlsTransport(Token, std::unique_ptr<asio::io_context> io, tcp::socket socket,
                 crypto::TlsContext tls_ctx);
    ~TlsTransport() override;

    TlsTransport(const TlsTransport&) = delete;
    TlsTransport& operator=(const TlsTransport&) = delete;

    // Resolve, connect within connect_timeout, then run the TLS client
    // handshake. Reads time out after read_timeout.
    [[nodiscard]] static util::Result<std::unique_ptr<TlsTransport>>
    connect(const std::string& host, uint16_t port, const util::NetworkConfig& config);

    // Server side of an accepted socket. The socket's io_context must
    // outlive the transport.
    [[nodiscard]] static util::Result<std::unique_ptr<TlsTransport>>
    accept(tcp::socket socket, crypto::TlsContext tls_ctx,
           std::chrono::milliseconds read_timeout);

    [[nodiscard]] util::VoidResult send(std::span<const uint8_t> data) override;
    [[nodiscard]] util::Result<std::vector<uint8_t>> recv_exact(size_t count) override;
    [[nodiscard]] util::Result<std::vector<uint8_t>> peer_certificate_der() const override;
    [[nodiscard]] std::string remote_address() const override;
    void close() override;

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] uint16_t remote_port() const;
    [[nodiscard]] std::string cipher() const { return tls_.cipher(); }
    [[nodiscard]] std::string tls_version() const { return tls_.version(); }

private:
    [[nodiscard]] util::VoidResult tls_handshake(bool as_client);
    void set_read_timeout(std::chrono::milliseconds timeout);

    // Declared before socket_: the socket is bound to it
    std::unique_ptr<asio::io_context> io_;
    tcp::socket socket_;
    crypto::TlsContext tls_ctx_;
    crypto::TlsSession tls_;
    ConnectionState state_{ConnectionState::Disconnected};
};

[[nodiscard]] const char* connection_state_name(ConnectionState state);

// Map a Boost.Asio error onto the transport error codes
[[nodiscard]] util::Error from_boost_error(const boost::system::error_code& ec,
                                           const std::string& context);

}  // namespace torlink::net
