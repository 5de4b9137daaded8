#include "torlink/net/connection.hpp"
#include "torlink/util/logging.hpp"
#include <boost/asio/connect.hpp>
#include <format>
#include <sys/socket.h>
#include <sys/time.h>

namespace torlink::net {

namespace {

util::Error transport_error(util::Error::Code code, std::string message) {
    return util::Error(code, std::move(message));
}

// Map a session failure onto the transport error codes
util::Error from_tls_error(crypto::TlsError err, const char* operation) {
    switch (err) {
        case crypto::TlsError::ConnectionClosed:
            return transport_error(util::Error::Code::ConnectionClosed,
                std::format("{}: peer closed the connection", operation));
        case crypto::TlsError::WouldBlock:
            return transport_error(util::Error::Code::Timeout,
                std::format("{}: timed out", operation));
        case crypto::TlsError::ReadFailed:
        case crypto::TlsError::WriteFailed:
            return transport_error(util::Error::Code::IoError,
                std::format("{}: {} ({})", operation,
                            crypto::tls_error_message(err), crypto::get_openssl_error()));
        default:
            return transport_error(util::Error::Code::TlsError,
                std::format("{}: {} ({})", operation,
                            crypto::tls_error_message(err), crypto::get_openssl_error()));
    }
}

}  // namespace

TlsTransport::TlsTransport(Token, std::unique_ptr<asio::io_context> io, tcp::socket socket,
                           crypto::TlsContext tls_ctx)
    : io_(std::move(io))
    , socket_(std::move(socket))
    , tls_ctx_(std::move(tls_ctx)) {}

TlsTransport::~TlsTransport() {
    close();
}

util::Result<std::unique_ptr<TlsTransport>> TlsTransport::connect(
    const std::string& host, uint16_t port, const util::NetworkConfig& config) {
    auto io = std::make_unique<asio::io_context>();

    boost::system::error_code ec;
    tcp::resolver resolver(*io);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return std::unexpected(transport_error(util::Error::Code::ConnectionFailed,
            std::format("cannot resolve {}: {}", host, ec.message())));
    }

    // Async connect bounded by run_for gives the connect timeout
    tcp::socket socket(*io);
    boost::system::error_code connect_ec = asio::error::would_block;
    asio::async_connect(socket, endpoints,
        [&connect_ec](const boost::system::error_code& result, const tcp::endpoint&) {
            connect_ec = result;
        });
    io->run_for(config.connect_timeout);

    if (connect_ec == asio::error::would_block) {
        socket.close(ec);
        return std::unexpected(transport_error(util::Error::Code::Timeout,
            std::format("connect to {}:{} timed out after {}ms",
                        host, port, config.connect_timeout.count())));
    }
    if (connect_ec) {
        return std::unexpected(from_boost_error(connect_ec,
            std::format("connect to {}:{}", host, port)));
    }

    // Async ops leave the descriptor non-blocking; OpenSSL drives it directly
    socket.non_blocking(false, ec);
    if (ec) {
        return std::unexpected(from_boost_error(ec, "socket setup"));
    }

    crypto::TlsContext tls_ctx;
    if (auto init = tls_ctx.init_client(); !init) {
        return std::unexpected(from_tls_error(init.error(), "TLS client setup"));
    }

    auto transport = std::make_unique<TlsTransport>(
        Token{}, std::move(io), std::move(socket), std::move(tls_ctx));
    transport->set_read_timeout(config.read_timeout);

    TORLINK_TRY_VOID(transport->tls_handshake(true));

    LOG_DEBUG("TLS link to {}:{} established ({}, {})",
              host, port, transport->tls_version(), transport->cipher());
    return transport;
}

util::Result<std::unique_ptr<TlsTransport>> TlsTransport::accept(
    tcp::socket socket, crypto::TlsContext tls_ctx, std::chrono::milliseconds read_timeout) {
    if (!tls_ctx.is_initialized()) {
        return std::unexpected(transport_error(util::Error::Code::TlsError,
            "TLS server context is not initialized"));
    }

    boost::system::error_code ec;
    socket.non_blocking(false, ec);
    if (ec) {
        return std::unexpected(from_boost_error(ec, "socket setup"));
    }

    auto transport = std::make_unique<TlsTransport>(
        Token{}, nullptr, std::move(socket), std::move(tls_ctx));
    transport->set_read_timeout(read_timeout);

    TORLINK_TRY_VOID(transport->tls_handshake(false));
    return transport;
}

util::VoidResult TlsTransport::tls_handshake(bool as_client) {
    state_ = ConnectionState::TlsHandshake;

    auto init = tls_.init(tls_ctx_, static_cast<int>(socket_.native_handle()));
    if (!init) {
        state_ = ConnectionState::Error;
        return std::unexpected(from_tls_error(init.error(), "TLS session setup"));
    }

    auto result = as_client ? tls_.connect() : tls_.accept();
    if (!result) {
        state_ = ConnectionState::Error;
        return std::unexpected(from_tls_error(result.error(), "TLS handshake"));
    }

    state_ = ConnectionState::Ready;
    return util::unit;
}

void TlsTransport::set_read_timeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    int fd = static_cast<int>(socket_.native_handle());
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        LOG_WARN("Failed to apply {}ms socket timeout", timeout.count());
    }
}

util::VoidResult TlsTransport::send(std::span<const uint8_t> data) {
    if (state_ != ConnectionState::Ready) {
        return std::unexpected(transport_error(util::Error::Code::ConnectionClosed,
            std::format("send on {} transport", connection_state_name(state_))));
    }

    size_t total = 0;
    while (total < data.size()) {
        auto written = tls_.write(data.subspan(total));
        if (!written) {
            state_ = ConnectionState::Error;
            return std::unexpected(from_tls_error(written.error(), "send"));
        }
        total += *written;
    }
    return util::unit;
}

util::Result<std::vector<uint8_t>> TlsTransport::recv_exact(size_t count) {
    if (state_ != ConnectionState::Ready) {
        return std::unexpected(transport_error(util::Error::Code::ConnectionClosed,
            std::format("receive on {} transport", connection_state_name(state_))));
    }

    std::vector<uint8_t> buffer(count);
    size_t total = 0;
    while (total < count) {
        auto got = tls_.read(std::span<uint8_t>(buffer).subspan(total));
        if (!got) {
            state_ = ConnectionState::Error;
            return std::unexpected(from_tls_error(got.error(), "receive"));
        }
        total += *got;
    }
    return buffer;
}

util::Result<std::vector<uint8_t>> TlsTransport::peer_certificate_der() const {
    auto der = tls_.peer_certificate_der();
    if (!der) {
        return std::unexpected(from_tls_error(der.error(), "peer certificate"));
    }
    return std::move(*der);
}

std::string TlsTransport::remote_address() const {
    if (!socket_.is_open()) return "";
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) return "";
    return endpoint.address().to_string();
}

uint16_t TlsTransport::remote_port() const {
    if (!socket_.is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) return 0;
    return endpoint.port();
}

void TlsTransport::close() {
    if (state_ == ConnectionState::Closed) return;

    tls_.shutdown();
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
    state_ = ConnectionState::Closed;
}

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::TlsHandshake: return "TlsHandshake";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Closed: return "Closed";
        case ConnectionState::Error: return "Error";
        default: return "Unknown";
    }
}

util::Error from_boost_error(const boost::system::error_code& ec, const std::string& context) {
    auto message = std::format("{}: {}", context, ec.message());
    if (ec == asio::error::eof || ec == asio::error::broken_pipe ||
        ec == asio::error::connection_reset) {
        return transport_error(util::Error::Code::ConnectionClosed, std::move(message));
    }
    if (ec == asio::error::timed_out || ec == asio::error::would_block) {
        return transport_error(util::Error::Code::Timeout, std::move(message));
    }
    if (ec == asio::error::connection_refused || ec == asio::error::host_unreachable ||
        ec == asio::error::network_unreachable || ec == asio::error::host_not_found) {
        return transport_error(util::Error::Code::ConnectionFailed, std::move(message));
    }
    return transport_error(util::Error::Code::IoError, std::move(message));
}

}  // namespace torlink::net
