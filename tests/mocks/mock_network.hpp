#pragma once

#include "torlink/core/cell.hpp"
#include "torlink/net/transport.hpp"
#include "torlink/protocol/cell_codec.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace torlink::test {

// Scripted byte stream standing in for a TLS connection. The test owns it;
// MockTransport hands a Channel a view of it.
class MockSocket {
public:
    MockSocket() = default;

    // Inject data to be read from socket
    void inject_data(std::span<const uint8_t> data) {
        read_buffer_.insert(read_buffer_.end(), data.begin(), data.end());
    }

    // Inject an encoded cell
    void inject_cell(const core::Cell& cell,
                     core::CircuitIdWidth width = core::CircuitIdWidth::Bits16) {
        auto bytes = protocol::CellCodec(width).encode(cell);
        if (bytes) {
            inject_data(*bytes);
        }
    }

    // Get all data that was "sent"
    std::vector<uint8_t> drain_sent_data() {
        auto data = std::move(sent_data_);
        sent_data_.clear();
        return data;
    }

    [[nodiscard]] size_t buffered() const { return read_buffer_.size(); }
    [[nodiscard]] size_t send_calls() const { return send_calls_; }
    [[nodiscard]] bool closed() const { return closed_; }

    void set_peer_certificate(std::vector<uint8_t> der) { peer_cert_ = std::move(der); }
    void set_remote_address(std::string address) { remote_address_ = std::move(address); }

    // Next send fails with this error
    void fail_next_send(util::Error error) { send_error_ = std::move(error); }

    // Reads past the scripted data fail with this code
    void set_eof_code(util::Error::Code code) { eof_code_ = code; }

private:
    friend class MockTransport;

    std::deque<uint8_t> read_buffer_;
    std::vector<uint8_t> sent_data_;
    std::optional<std::vector<uint8_t>> peer_cert_;
    std::string remote_address_{"127.0.0.1"};
    std::optional<util::Error> send_error_;
    util::Error::Code eof_code_{util::Error::Code::ConnectionClosed};
    size_t send_calls_{0};
    bool closed_{false};
};

class MockTransport : public net::Transport {
public:
    explicit MockTransport(MockSocket& socket) : socket_(socket) {}

    [[nodiscard]] util::VoidResult send(std::span<const uint8_t> data) override {
        ++socket_.send_calls_;
        if (socket_.send_error_) {
            auto error = std::move(*socket_.send_error_);
            socket_.send_error_.reset();
            return std::unexpected(std::move(error));
        }
        socket_.sent_data_.insert(socket_.sent_data_.end(), data.begin(), data.end());
        return util::unit;
    }

    [[nodiscard]] util::Result<std::vector<uint8_t>> recv_exact(size_t count) override {
        if (socket_.read_buffer_.size() < count) {
            socket_.read_buffer_.clear();
            return std::unexpected(util::Error(socket_.eof_code_, "mock stream exhausted"));
        }
        std::vector<uint8_t> out(socket_.read_buffer_.begin(),
                                 socket_.read_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        socket_.read_buffer_.erase(socket_.read_buffer_.begin(),
                                   socket_.read_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        return out;
    }

    [[nodiscard]] util::Result<std::vector<uint8_t>> peer_certificate_der() const override {
        if (!socket_.peer_cert_) {
            return std::unexpected(util::Error(util::Error::Code::TlsError,
                                               "peer presented no certificate"));
        }
        return *socket_.peer_cert_;
    }

    [[nodiscard]] std::string remote_address() const override {
        return socket_.remote_address_;
    }

    void close() override { socket_.closed_ = true; }

private:
    MockSocket& socket_;
};

}  // namespace torlink::test
