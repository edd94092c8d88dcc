#include "vault/keys.hpp"
#include "vault/errors.hpp"
#include <algorithm>
#include <cstring>

namespace vault {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

bool is_default(const Key32& key) {
    return std::all_of(key.begin(), key.end(), [](uint8_t b) { return b == 0; });
}

Identity identity_from_bytes(const std::string& bytes, const std::string& field_name) {
    if (bytes.size() != KEY_BYTES) {
        throw SettlementError(ErrorCode::InvalidIdentity,
                              field_name + " must be 32 bytes, got " + std::to_string(bytes.size()));
    }
    Identity id{};
    std::memcpy(id.data(), bytes.data(), KEY_BYTES);
    if (is_default(id)) {
        throw SettlementError(ErrorCode::InvalidIdentity, field_name + " must not be the default key");
    }
    return id;
}

Address address_from_bytes(const std::string& bytes) {
    if (bytes.size() != KEY_BYTES) {
        throw SettlementError::invalid_input("address must be 32 bytes, got " +
                                             std::to_string(bytes.size()));
    }
    Address address{};
    std::memcpy(address.data(), bytes.data(), KEY_BYTES);
    return address;
}

std::string to_hex(const std::string& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        hex.push_back(hex_chars[c >> 4]);
        hex.push_back(hex_chars[c & 0x0f]);
    }
    return hex;
}

std::string from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw SettlementError::invalid_input("hex string has odd length");
    }
    std::string out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw SettlementError::invalid_input("invalid hex character");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

Key32 key_from_hex(const std::string& hex) {
    return address_from_bytes(from_hex(hex));
}

} // namespace vault
