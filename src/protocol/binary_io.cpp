#include "torlink/protocol/binary_io.hpp"
#include <format>

namespace torlink::protocol {

// --- BinaryReader ---

BinaryReader::BinaryReader(std::span<const uint8_t> data)
    : data_(data) {}

util::VoidResult BinaryReader::require(size_t count) const {
    if (remaining() < count) {
        return std::unexpected(util::Error::invalid_format(
            std::format("truncated: need {} bytes at offset {}, {} left",
                        count, pos_, remaining())));
    }
    return util::unit;
}

util::Result<uint8_t> BinaryReader::read_u8() {
    TORLINK_TRY_VOID(require(1));
    return data_[pos_++];
}

util::Result<uint16_t> BinaryReader::read_u16() {
    TORLINK_TRY_VOID(require(2));
    uint16_t val = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return val;
}

util::Result<uint32_t> BinaryReader::read_u32() {
    TORLINK_TRY_VOID(require(4));
    uint32_t val = (static_cast<uint32_t>(data_[pos_]) << 24) |
                   (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                   (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                    static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return val;
}

util::Result<std::vector<uint8_t>> BinaryReader::read_bytes(size_t count) {
    auto bytes = TORLINK_TRY(read_span(count));
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

util::Result<std::span<const uint8_t>> BinaryReader::read_span(size_t count) {
    TORLINK_TRY_VOID(require(count));
    auto out = data_.subspan(pos_, count);
    pos_ += count;
    return out;
}

// --- BinaryWriter ---

BinaryWriter::BinaryWriter(size_t reserve) {
    buffer_.reserve(reserve);
}

void BinaryWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void BinaryWriter::write_u16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void BinaryWriter::write_u32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 24));
    buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void BinaryWriter::write_bytes(std::span<const uint8_t> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void BinaryWriter::write_padding(size_t count) {
    buffer_.insert(buffer_.end(), count, 0);
}

}  // namespace torlink::protocol
