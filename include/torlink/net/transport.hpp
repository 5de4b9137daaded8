#pragma once

#include "torlink/util/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace torlink::net {

// Byte stream a Channel is framed over. Blocking; exact-count reads.
// Failures carry the ConnectionClosed/IoError/Timeout/TlsError codes
// with the transport's own reason text.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual util::VoidResult send(std::span<const uint8_t> data) = 0;

    // Blocks until exactly count bytes arrived or the stream failed
    [[nodiscard]] virtual util::Result<std::vector<uint8_t>> recv_exact(size_t count) = 0;

    // DER encoding of the certificate the peer presented during TLS
    [[nodiscard]] virtual util::Result<std::vector<uint8_t>> peer_certificate_der() const = 0;

    [[nodiscard]] virtual std::string remote_address() const = 0;

    virtual void close() = 0;
};

}  // namespace torlink::net
