#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace torlink::crypto {

enum class TlsError {
    ContextCreationFailed,
    CertificateLoadFailed,
    KeyLoadFailed,
    HandshakeFailed,
    ReadFailed,
    WriteFailed,
    ConnectionClosed,
    WouldBlock,
    NoPeerCertificate,
    OpenSSLError,
};

// PEM-encoded certificate and private key
struct PemCredentials {
    std::vector<uint8_t> cert_pem;
    std::vector<uint8_t> key_pem;
};

// SSL_CTX wrapper
class TlsContext {
public:
    TlsContext();
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;
    TlsContext(TlsContext&&) noexcept;
    TlsContext& operator=(TlsContext&&) noexcept;

    // Client mode without peer verification. Relays present self-signed
    // link certificates; identity comes from the CERTS cell instead.
    [[nodiscard]] std::expected<void, TlsError> init_client();

    // Server mode with in-memory PEM credentials (loopback tests)
    [[nodiscard]] std::expected<void, TlsError> init_server(const PemCredentials& creds);

    // Self-signed RSA certificate, as relays use for their link key
    [[nodiscard]] static std::expected<PemCredentials, TlsError>
    generate_self_signed_cert(const std::string& common_name);

    // DER encoding of a PEM certificate
    [[nodiscard]] static std::expected<std::vector<uint8_t>, TlsError>
    pem_to_der(std::span<const uint8_t> cert_pem);

    [[nodiscard]] void* native_handle() { return ctx_; }
    [[nodiscard]] bool is_initialized() const { return ctx_ != nullptr; }

private:
    void reset();

    void* ctx_{nullptr};  // SSL_CTX*
};

// SSL object bound to a connected socket
class TlsSession {
public:
    TlsSession();
    ~TlsSession();

    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;
    TlsSession(TlsSession&&) noexcept;
    TlsSession& operator=(TlsSession&&) noexcept;

    [[nodiscard]] std::expected<void, TlsError> init(TlsContext& ctx, int fd);

    // Blocking handshakes
    [[nodiscard]] std::expected<void, TlsError> connect();
    [[nodiscard]] std::expected<void, TlsError> accept();

    [[nodiscard]] std::expected<size_t, TlsError> read(std::span<uint8_t> buffer);
    [[nodiscard]] std::expected<size_t, TlsError> write(std::span<const uint8_t> data);

    void shutdown();

    [[nodiscard]] bool is_handshake_complete() const { return handshake_complete_; }

    // Peer certificate in its original DER encoding
    [[nodiscard]] std::expected<std::vector<uint8_t>, TlsError> peer_certificate_der() const;

    [[nodiscard]] std::string cipher() const;
    [[nodiscard]] std::string version() const;

private:
    [[nodiscard]] std::expected<void, TlsError> handshake();

    void* ssl_{nullptr};  // SSL*
    bool handshake_complete_{false};
};

[[nodiscard]] std::string tls_error_message(TlsError err);
[[nodiscard]] std::string get_openssl_error();

}  // namespace torlink::crypto
