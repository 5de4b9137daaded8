#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <utility>

namespace torlink::util {

// Error with a code from the link-layer taxonomy plus context
class Error {
public:
    enum class Code {
        Unknown = 0,
        InvalidArgument,

        // Binary format / protocol
        InvalidFormat,
        InvalidVersion,
        VersionMismatch,
        UnexpectedCommand,
        ProtocolError,
        NotImplemented,

        // Identity
        CertMismatch,

        // Transport
        ConnectionFailed,
        ConnectionClosed,
        IoError,
        Timeout,
        TlsError,

        // Crypto primitives
        CryptoError,

        // Configuration
        ConfigError,
    };

    Error() = default;

    Error(Code code, std::string message,
          std::source_location loc = std::source_location::current())
        : code_(code), message_(std::move(message)),
          file_(loc.file_name()), line_(loc.line()) {}

    [[nodiscard]] Code code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const char* file() const { return file_; }
    [[nodiscard]] uint32_t line() const { return line_; }

    [[nodiscard]] bool is_transport() const {
        return code_ == Code::ConnectionFailed || code_ == Code::ConnectionClosed ||
               code_ == Code::IoError || code_ == Code::Timeout ||
               code_ == Code::TlsError;
    }

    [[nodiscard]] std::string to_string() const;

    // Convenience constructors
    [[nodiscard]] static Error invalid_argument(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::InvalidArgument, std::move(msg), loc);
    }

    [[nodiscard]] static Error invalid_format(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::InvalidFormat, std::move(msg), loc);
    }

    [[nodiscard]] static Error invalid_version(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::InvalidVersion, std::move(msg), loc);
    }

    [[nodiscard]] static Error unexpected_command(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::UnexpectedCommand, std::move(msg), loc);
    }

    [[nodiscard]] static Error protocol_error(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::ProtocolError, std::move(msg), loc);
    }

    [[nodiscard]] static Error not_implemented(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::NotImplemented, std::move(msg), loc);
    }

    [[nodiscard]] static Error cert_mismatch(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::CertMismatch, std::move(msg), loc);
    }

    [[nodiscard]] static Error crypto_error(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::CryptoError, std::move(msg), loc);
    }

    [[nodiscard]] static Error config_error(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::ConfigError, std::move(msg), loc);
    }

private:
    Code code_{Code::Unknown};
    std::string message_;
    const char* file_{"unknown"};
    uint32_t line_{0};
};

template <typename T>
using Result = std::expected<T, Error>;

// Unit type for void results
struct Unit {};
inline constexpr Unit unit{};

using VoidResult = Result<Unit>;

// Helper macros for error propagation (GNU statement expressions)
#define TORLINK_TRY(expr)                            \
    ({                                               \
        auto&& _result = (expr);                     \
        if (!_result) {                              \
            return std::unexpected(_result.error()); \
        }                                            \
        std::move(*_result);                         \
    })

#define TORLINK_TRY_VOID(expr)                       \
    do {                                             \
        auto&& _result = (expr);                     \
        if (!_result) {                              \
            return std::unexpected(_result.error()); \
        }                                            \
    } while (0)

[[nodiscard]] constexpr const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::Unknown: return "Unknown";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::InvalidFormat: return "InvalidFormat";
        case Error::Code::InvalidVersion: return "InvalidVersion";
        case Error::Code::VersionMismatch: return "VersionMismatch";
        case Error::Code::UnexpectedCommand: return "UnexpectedCommand";
        case Error::Code::ProtocolError: return "ProtocolError";
        case Error::Code::NotImplemented: return "NotImplemented";
        case Error::Code::CertMismatch: return "CertMismatch";
        case Error::Code::ConnectionFailed: return "ConnectionFailed";
        case Error::Code::ConnectionClosed: return "ConnectionClosed";
        case Error::Code::IoError: return "IoError";
        case Error::Code::Timeout: return "Timeout";
        case Error::Code::TlsError: return "TlsError";
        case Error::Code::CryptoError: return "CryptoError";
        case Error::Code::ConfigError: return "ConfigError";
        default: return "Unknown";
    }
}

inline std::string Error::to_string() const {
    return std::format("{}:{}: [{}] {}",
                       file_, line_, error_code_name(code_), message_);
}

}  // namespace torlink::util
