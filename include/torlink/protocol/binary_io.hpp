#pragma once

#include "torlink/util/result.hpp"
#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace torlink::protocol {

// Sequential big-endian cursor over a byte buffer.
// Every short read fails with InvalidFormat and leaves the cursor unchanged.
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data);

    [[nodiscard]] util::Result<uint8_t> read_u8();
    [[nodiscard]] util::Result<uint16_t> read_u16();
    [[nodiscard]] util::Result<uint32_t> read_u32();

    // Read bytes into a new vector
    [[nodiscard]] util::Result<std::vector<uint8_t>> read_bytes(size_t count);

    // View of the next count bytes, no copy
    [[nodiscard]] util::Result<std::span<const uint8_t>> read_span(size_t count);

    template <size_t N>
    [[nodiscard]] util::Result<std::array<uint8_t, N>> read_array() {
        std::array<uint8_t, N> out{};
        auto bytes = read_span(N);
        if (!bytes) return std::unexpected(bytes.error());
        std::memcpy(out.data(), bytes->data(), N);
        return out;
    }

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const { return pos_ >= data_.size(); }

    [[nodiscard]] std::span<const uint8_t> remaining_span() const {
        return data_.subspan(pos_);
    }

private:
    [[nodiscard]] util::VoidResult require(size_t count) const;

    std::span<const uint8_t> data_;
    size_t pos_{0};
};

class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve);

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);

    void write_bytes(std::span<const uint8_t> data);

    // Write padding (zeros)
    void write_padding(size_t count);

    [[nodiscard]] const std::vector<uint8_t>& data() const { return buffer_; }
    [[nodiscard]] std::vector<uint8_t> take() { return std::move(buffer_); }
    [[nodiscard]] size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

}  // namespace torlink::protocol
