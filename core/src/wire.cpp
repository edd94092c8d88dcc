#include "vault/wire.hpp"
#include "vault/errors.hpp"

namespace vault {

ByteWriter& ByteWriter::u8(uint8_t value) {
    buffer_.push_back(static_cast<char>(value));
    return *this;
}

ByteWriter& ByteWriter::u32(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
    return *this;
}

ByteWriter& ByteWriter::u64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
    return *this;
}

ByteWriter& ByteWriter::string(const std::string& value) {
    u32(static_cast<uint32_t>(value.size()));
    buffer_.append(value);
    return *this;
}

ByteWriter& ByteWriter::raw(const std::string& value) {
    buffer_.append(value);
    return *this;
}

void ByteReader::require(std::size_t count) const {
    if (count > remaining()) {
        throw SettlementError(ErrorCode::MalformedInstruction,
                              "truncated payload: need " + std::to_string(count) + " bytes, have " +
                                  std::to_string(remaining()));
    }
}

uint8_t ByteReader::u8() {
    require(1);
    return static_cast<uint8_t>(data_[offset_++]);
}

bool ByteReader::boolean() {
    uint8_t value = u8();
    if (value > 1) {
        throw SettlementError(ErrorCode::MalformedInstruction,
                              "invalid bool byte " + std::to_string(value));
    }
    return value == 1;
}

uint32_t ByteReader::u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<uint8_t>(data_[offset_++])) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::u64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(data_[offset_++])) << (8 * i);
    }
    return value;
}

std::string ByteReader::string(std::size_t max_length) {
    uint32_t length = u32();
    if (length > max_length) {
        throw SettlementError(ErrorCode::InputTooLong,
                              "string length " + std::to_string(length) + " exceeds " +
                                  std::to_string(max_length));
    }
    return raw(length);
}

std::string ByteReader::raw(std::size_t length) {
    require(length);
    std::string out = data_.substr(offset_, length);
    offset_ += length;
    return out;
}

void ByteReader::expect_end() const {
    if (remaining() != 0) {
        throw SettlementError(ErrorCode::MalformedInstruction,
                              std::to_string(remaining()) + " trailing bytes");
    }
}

} // namespace vault
