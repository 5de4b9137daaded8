#include "torlink/crypto/tls.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace torlink::crypto {

namespace {

// Reads a whole memory BIO into a byte vector
std::vector<uint8_t> drain_bio(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data) return {};
    return std::vector<uint8_t>(mem->data, mem->data + mem->length);
}

// Parses the first certificate of a PEM buffer; caller frees
X509* read_pem_cert(std::span<const uint8_t> pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) return nullptr;
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return cert;
}

// DER encoding; empty on failure
std::vector<uint8_t> encode_der(X509* cert) {
    int len = i2d_X509(cert, nullptr);
    if (len <= 0) return {};

    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    if (i2d_X509(cert, &out) != len) return {};
    return der;
}

}  // namespace

// TlsContext implementation
TlsContext::TlsContext() = default;

TlsContext::~TlsContext() {
    reset();
}

TlsContext::TlsContext(TlsContext&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

TlsContext& TlsContext::operator=(TlsContext&& other) noexcept {
    if (this != &other) {
        reset();
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void TlsContext::reset() {
    if (ctx_) {
        SSL_CTX_free(static_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

std::expected<void, TlsError> TlsContext::init_client() {
    reset();
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        return std::unexpected(TlsError::ContextCreationFailed);
    }

    auto* ssl_ctx = static_cast<SSL_CTX*>(ctx_);
    SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
    SSL_CTX_set_verify(ssl_ctx, SSL_VERIFY_NONE, nullptr);

    return {};
}

std::expected<void, TlsError> TlsContext::init_server(const PemCredentials& creds) {
    reset();
    ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ctx_) {
        return std::unexpected(TlsError::ContextCreationFailed);
    }

    auto* ssl_ctx = static_cast<SSL_CTX*>(ctx_);
    SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);

    X509* cert = read_pem_cert(creds.cert_pem);
    if (!cert || SSL_CTX_use_certificate(ssl_ctx, cert) != 1) {
        if (cert) X509_free(cert);
        reset();
        return std::unexpected(TlsError::CertificateLoadFailed);
    }
    X509_free(cert);

    // Load private key from memory
    BIO* key_bio = BIO_new_mem_buf(creds.key_pem.data(),
                                   static_cast<int>(creds.key_pem.size()));
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(key_bio, nullptr, nullptr, nullptr);
    BIO_free(key_bio);

    if (!pkey || SSL_CTX_use_PrivateKey(ssl_ctx, pkey) != 1) {
        if (pkey) EVP_PKEY_free(pkey);
        reset();
        return std::unexpected(TlsError::KeyLoadFailed);
    }
    EVP_PKEY_free(pkey);

    return {};
}

std::expected<PemCredentials, TlsError>
TlsContext::generate_self_signed_cert(const std::string& common_name) {
    EVP_PKEY* pkey = EVP_RSA_gen(2048);
    if (!pkey) {
        return std::unexpected(TlsError::KeyLoadFailed);
    }

    X509* x509 = X509_new();
    if (!x509) {
        EVP_PKEY_free(pkey);
        return std::unexpected(TlsError::CertificateLoadFailed);
    }

    ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);

    // Valid for one day
    X509_gmtime_adj(X509_get_notBefore(x509), 0);
    X509_gmtime_adj(X509_get_notAfter(x509), 24 * 60 * 60);

    X509_set_pubkey(x509, pkey);

    X509_NAME* name = X509_get_subject_name(x509);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()),
                               -1, -1, 0);
    X509_set_issuer_name(x509, name);

    if (X509_sign(x509, pkey, EVP_sha256()) == 0) {
        X509_free(x509);
        EVP_PKEY_free(pkey);
        return std::unexpected(TlsError::CertificateLoadFailed);
    }

    PemCredentials creds;

    BIO* cert_bio = BIO_new(BIO_s_mem());
    PEM_write_bio_X509(cert_bio, x509);
    creds.cert_pem = drain_bio(cert_bio);
    BIO_free(cert_bio);

    BIO* key_bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(key_bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    creds.key_pem = drain_bio(key_bio);
    BIO_free(key_bio);

    X509_free(x509);
    EVP_PKEY_free(pkey);

    if (creds.cert_pem.empty() || creds.key_pem.empty()) {
        return std::unexpected(TlsError::OpenSSLError);
    }
    return creds;
}

std::expected<std::vector<uint8_t>, TlsError>
TlsContext::pem_to_der(std::span<const uint8_t> cert_pem) {
    X509* cert = read_pem_cert(cert_pem);
    if (!cert) {
        return std::unexpected(TlsError::CertificateLoadFailed);
    }

    auto der = encode_der(cert);
    X509_free(cert);
    if (der.empty()) {
        return std::unexpected(TlsError::OpenSSLError);
    }
    return der;
}

// TlsSession implementation
TlsSession::TlsSession() = default;

TlsSession::~TlsSession() {
    if (ssl_) {
        SSL_free(static_cast<SSL*>(ssl_));
    }
}

TlsSession::TlsSession(TlsSession&& other) noexcept
    : ssl_(other.ssl_), handshake_complete_(other.handshake_complete_) {
    other.ssl_ = nullptr;
    other.handshake_complete_ = false;
}

TlsSession& TlsSession::operator=(TlsSession&& other) noexcept {
    if (this != &other) {
        if (ssl_) {
            SSL_free(static_cast<SSL*>(ssl_));
        }
        ssl_ = other.ssl_;
        handshake_complete_ = other.handshake_complete_;
        other.ssl_ = nullptr;
        other.handshake_complete_ = false;
    }
    return *this;
}

std::expected<void, TlsError> TlsSession::init(TlsContext& ctx, int fd) {
    if (!ctx.is_initialized()) {
        return std::unexpected(TlsError::ContextCreationFailed);
    }

    ssl_ = SSL_new(static_cast<SSL_CTX*>(ctx.native_handle()));
    if (!ssl_) {
        return std::unexpected(TlsError::ContextCreationFailed);
    }

    if (SSL_set_fd(static_cast<SSL*>(ssl_), fd) != 1) {
        SSL_free(static_cast<SSL*>(ssl_));
        ssl_ = nullptr;
        return std::unexpected(TlsError::OpenSSLError);
    }

    return {};
}

std::expected<void, TlsError> TlsSession::handshake() {
    if (!ssl_) {
        return std::unexpected(TlsError::HandshakeFailed);
    }

    ERR_clear_error();
    int result = SSL_do_handshake(static_cast<SSL*>(ssl_));
    if (result == 1) {
        handshake_complete_ = true;
        return {};
    }

    int err = SSL_get_error(static_cast<SSL*>(ssl_), result);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return std::unexpected(TlsError::WouldBlock);
    }

    return std::unexpected(TlsError::HandshakeFailed);
}

std::expected<void, TlsError> TlsSession::connect() {
    if (!ssl_) {
        return std::unexpected(TlsError::HandshakeFailed);
    }

    SSL_set_connect_state(static_cast<SSL*>(ssl_));
    return handshake();
}

std::expected<void, TlsError> TlsSession::accept() {
    if (!ssl_) {
        return std::unexpected(TlsError::HandshakeFailed);
    }

    SSL_set_accept_state(static_cast<SSL*>(ssl_));
    return handshake();
}

std::expected<size_t, TlsError> TlsSession::read(std::span<uint8_t> buffer) {
    if (!ssl_ || !handshake_complete_) {
        return std::unexpected(TlsError::ReadFailed);
    }

    ERR_clear_error();
    int result = SSL_read(static_cast<SSL*>(ssl_), buffer.data(),
                          static_cast<int>(buffer.size()));
    if (result > 0) {
        return static_cast<size_t>(result);
    }

    int err = SSL_get_error(static_cast<SSL*>(ssl_), result);
    if (err == SSL_ERROR_ZERO_RETURN) {
        return std::unexpected(TlsError::ConnectionClosed);
    }
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return std::unexpected(TlsError::WouldBlock);
    }
    // Peer dropped TCP without close_notify
    if (err == SSL_ERROR_SSL &&
        ERR_GET_REASON(ERR_peek_error()) == SSL_R_UNEXPECTED_EOF_WHILE_READING) {
        return std::unexpected(TlsError::ConnectionClosed);
    }

    return std::unexpected(TlsError::ReadFailed);
}

std::expected<size_t, TlsError> TlsSession::write(std::span<const uint8_t> data) {
    if (!ssl_ || !handshake_complete_) {
        return std::unexpected(TlsError::WriteFailed);
    }

    ERR_clear_error();
    int result = SSL_write(static_cast<SSL*>(ssl_), data.data(),
                           static_cast<int>(data.size()));
    if (result > 0) {
        return static_cast<size_t>(result);
    }

    int err = SSL_get_error(static_cast<SSL*>(ssl_), result);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return std::unexpected(TlsError::WouldBlock);
    }

    return std::unexpected(TlsError::WriteFailed);
}

void TlsSession::shutdown() {
    if (ssl_ && handshake_complete_) {
        SSL_shutdown(static_cast<SSL*>(ssl_));
    }
    handshake_complete_ = false;
}

std::expected<std::vector<uint8_t>, TlsError> TlsSession::peer_certificate_der() const {
    if (!ssl_) {
        return std::unexpected(TlsError::OpenSSLError);
    }

    X509* cert = SSL_get1_peer_certificate(static_cast<SSL*>(ssl_));
    if (!cert) {
        return std::unexpected(TlsError::NoPeerCertificate);
    }

    auto der = encode_der(cert);
    X509_free(cert);
    if (der.empty()) {
        return std::unexpected(TlsError::OpenSSLError);
    }
    return der;
}

std::string TlsSession::cipher() const {
    if (!ssl_) return "";
    const char* name = SSL_get_cipher(static_cast<SSL*>(ssl_));
    return name ? name : "";
}

std::string TlsSession::version() const {
    if (!ssl_) return "";
    const char* name = SSL_get_version(static_cast<SSL*>(ssl_));
    return name ? name : "";
}

// Utility functions
std::string tls_error_message(TlsError err) {
    switch (err) {
        case TlsError::ContextCreationFailed: return "TLS context creation failed";
        case TlsError::CertificateLoadFailed: return "Certificate load failed";
        case TlsError::KeyLoadFailed: return "Key load failed";
        case TlsError::HandshakeFailed: return "TLS handshake failed";
        case TlsError::ReadFailed: return "TLS read failed";
        case TlsError::WriteFailed: return "TLS write failed";
        case TlsError::ConnectionClosed: return "Connection closed";
        case TlsError::WouldBlock: return "Operation would block";
        case TlsError::NoPeerCertificate: return "Peer presented no certificate";
        case TlsError::OpenSSLError: return "OpenSSL error";
        default: return "Unknown TLS error";
    }
}

std::string get_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "no OpenSSL error queued";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

}  // namespace torlink::crypto
