#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace vault {

/**
 * Little-endian byte writer for instruction payloads and hash preimages.
 *
 * Integers are fixed width, bools are one byte, strings carry a le32
 * length prefix unless written raw.
 */
class ByteWriter {
public:
    ByteWriter& u8(uint8_t value);
    ByteWriter& boolean(bool value) { return u8(value ? 1 : 0); }
    ByteWriter& u32(uint32_t value);
    ByteWriter& u64(uint64_t value);
    ByteWriter& i64(int64_t value) { return u64(static_cast<uint64_t>(value)); }

    /// le32 length + bytes.
    ByteWriter& string(const std::string& value);

    /// Bytes with no length prefix.
    ByteWriter& raw(const std::string& value);

    template<std::size_t N>
    ByteWriter& fixed(const std::array<uint8_t, N>& value) {
        buffer_.append(reinterpret_cast<const char*>(value.data()), N);
        return *this;
    }

    const std::string& bytes() const { return buffer_; }
    std::string take() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/**
 * Reader counterpart of ByteWriter. Every read past the end throws
 * SettlementError MalformedInstruction.
 */
class ByteReader {
public:
    explicit ByteReader(const std::string& data) : data_(data) {}

    uint8_t u8();
    bool boolean();
    uint32_t u32();
    uint64_t u64();
    int64_t i64() { return static_cast<int64_t>(u64()); }

    /// le32 length + bytes; the length must not exceed `max_length`.
    std::string string(std::size_t max_length);

    /// Exactly `length` bytes.
    std::string raw(std::size_t length);

    template<std::size_t N>
    std::array<uint8_t, N> fixed() {
        std::array<uint8_t, N> out{};
        auto bytes = raw(N);
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    std::size_t remaining() const { return data_.size() - offset_; }

    /// Throws MalformedInstruction if unread bytes remain.
    void expect_end() const;

private:
    void require(std::size_t count) const;

    const std::string& data_;
    std::size_t offset_ = 0;
};

} // namespace vault
