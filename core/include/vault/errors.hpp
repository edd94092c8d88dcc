#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace vault {

/**
 * Broad class of a settlement failure.
 *
 * Clients use the category to tell "try again later" (State, and the
 * freshness half of ReplayFreshness) from "this will never succeed".
 */
enum class ErrorCategory {
    Validation,
    Authorization,
    ReplayFreshness,
    State,
    Arithmetic
};

/**
 * Named failure reasons surfaced to callers.
 */
enum class ErrorCode {
    // Validation
    InvalidInput,
    InputTooLong,
    InvalidSessionId,
    InvalidIdentity,
    InsufficientPayment,
    MalformedInstruction,
    UnknownInstruction,
    // Authorization
    Unauthorized,
    UnauthorizedJudge,
    InvalidSignature,
    InvalidDecisionHash,
    // Replay / freshness
    EntryAlreadyExists,
    StaleInstruction,
    InvalidTimestamp,
    TimestampOutOfRange,
    // State
    LedgerNotInitialized,
    LedgerAlreadyInitialized,
    LedgerInactive,
    ReentrancyDetected,
    EscapePlanNotReady,
    NoParticipants,
    RecoveryCooldownActive,
    InsufficientFunds,
    // Arithmetic
    ArithmeticOverflow,
    SplitInvariantViolated,
    RecoveryAmountExceedsLimit
};

/// Stable name of an error code, used on the wire and in logs.
const char* error_code_name(ErrorCode code);

/// Category an error code belongs to.
ErrorCategory category_of(ErrorCode code);

const char* category_name(ErrorCategory category);

/**
 * Thrown when an instruction is rejected. Every rejection aborts the
 * whole instruction with no effects.
 */
class SettlementError : public std::runtime_error {
public:
    SettlementError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return category_of(code_); }
    const char* code_name() const { return error_code_name(code_); }

    /**
     * Returns true if the same request may succeed later without change
     * (state errors and stale/future timestamps).
     */
    bool is_retryable() const;

    grpc::StatusCode status_code() const;

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), std::string(code_name()) + ": " + what());
    }

    static SettlementError invalid_input(const std::string& message) {
        return SettlementError(ErrorCode::InvalidInput, message);
    }

    static SettlementError unauthorized(const std::string& message) {
        return SettlementError(ErrorCode::Unauthorized, message);
    }

    static SettlementError overflow(const std::string& message) {
        return SettlementError(ErrorCode::ArithmeticOverflow, message);
    }

private:
    ErrorCode code_;
};

/**
 * Thrown when configuration cannot be loaded or is out of range.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace vault
