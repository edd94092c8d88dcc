#pragma once

#include <string>
#include "vault/errors.hpp"
#include "vault/keys.hpp"

namespace vault {
namespace validation {

/**
 * Require that an account exists (has prior events).
 */
inline void require_exists(bool exists, ErrorCode code = ErrorCode::LedgerNotInitialized,
                           const std::string& message = "account does not exist") {
    if (!exists) {
        throw SettlementError(code, message);
    }
}

/**
 * Require that an account does not exist.
 */
inline void require_not_exists(bool exists, ErrorCode code = ErrorCode::LedgerAlreadyInitialized,
                               const std::string& message = "account already exists") {
    if (exists) {
        throw SettlementError(code, message);
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw SettlementError::invalid_input(field_name + " must be positive");
    }
}

/**
 * Require that an identity is set (not the all-zero key).
 */
inline void require_identity(const Identity& identity, const std::string& field_name = "identity") {
    if (is_default(identity)) {
        throw SettlementError(ErrorCode::InvalidIdentity, field_name + " must not be the default key");
    }
}

/**
 * Require that the signer is the expected authority.
 */
inline void require_signer(const Identity& signer, const Identity& expected,
                           const std::string& message = "signer is not the ledger authority") {
    if (signer != expected) {
        throw SettlementError::unauthorized(message);
    }
}

} // namespace validation
} // namespace vault
