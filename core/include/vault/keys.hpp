#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace vault {

constexpr std::size_t KEY_BYTES = 32;
constexpr std::size_t DIGEST_BYTES = 32;
constexpr std::size_t SIGNATURE_BYTES = 64;

using Key32 = std::array<uint8_t, KEY_BYTES>;

/// Public identity of a participant, authority or judge (Ed25519 public key).
using Identity = Key32;

/// Seed-derived storage address of an account.
using Address = Key32;

using Digest = std::array<uint8_t, DIGEST_BYTES>;
using Signature = std::array<uint8_t, SIGNATURE_BYTES>;

/// True for the all-zero key, which never names a real identity.
bool is_default(const Key32& key);

/**
 * Parse a 32-byte identity from raw protobuf bytes.
 * @throws SettlementError InvalidIdentity on wrong length or the default key.
 */
Identity identity_from_bytes(const std::string& bytes, const std::string& field_name = "identity");

/**
 * Parse a 32-byte address from raw bytes.
 * @throws SettlementError InvalidInput on wrong length.
 */
Address address_from_bytes(const std::string& bytes);

template<std::size_t N>
std::string to_bytes(const std::array<uint8_t, N>& value) {
    return std::string(reinterpret_cast<const char*>(value.data()), N);
}

std::string to_hex(const std::string& bytes);

template<std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& value) {
    return to_hex(to_bytes(value));
}

/// Decode lowercase or uppercase hex; throws SettlementError InvalidInput.
std::string from_hex(const std::string& hex);

Key32 key_from_hex(const std::string& hex);

} // namespace vault
