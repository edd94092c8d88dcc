#include "vault/errors.hpp"

namespace vault {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::InputTooLong: return "InputTooLong";
        case ErrorCode::InvalidSessionId: return "InvalidSessionId";
        case ErrorCode::InvalidIdentity: return "InvalidIdentity";
        case ErrorCode::InsufficientPayment: return "InsufficientPayment";
        case ErrorCode::MalformedInstruction: return "MalformedInstruction";
        case ErrorCode::UnknownInstruction: return "UnknownInstruction";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::UnauthorizedJudge: return "UnauthorizedJudge";
        case ErrorCode::InvalidSignature: return "InvalidSignature";
        case ErrorCode::InvalidDecisionHash: return "InvalidDecisionHash";
        case ErrorCode::EntryAlreadyExists: return "EntryAlreadyExists";
        case ErrorCode::StaleInstruction: return "StaleInstruction";
        case ErrorCode::InvalidTimestamp: return "InvalidTimestamp";
        case ErrorCode::TimestampOutOfRange: return "TimestampOutOfRange";
        case ErrorCode::LedgerNotInitialized: return "LedgerNotInitialized";
        case ErrorCode::LedgerAlreadyInitialized: return "LedgerAlreadyInitialized";
        case ErrorCode::LedgerInactive: return "LedgerInactive";
        case ErrorCode::ReentrancyDetected: return "ReentrancyDetected";
        case ErrorCode::EscapePlanNotReady: return "EscapePlanNotReady";
        case ErrorCode::NoParticipants: return "NoParticipants";
        case ErrorCode::RecoveryCooldownActive: return "RecoveryCooldownActive";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::SplitInvariantViolated: return "SplitInvariantViolated";
        case ErrorCode::RecoveryAmountExceedsLimit: return "RecoveryAmountExceedsLimit";
    }
    return "Unknown";
}

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:
        case ErrorCode::InputTooLong:
        case ErrorCode::InvalidSessionId:
        case ErrorCode::InvalidIdentity:
        case ErrorCode::InsufficientPayment:
        case ErrorCode::MalformedInstruction:
        case ErrorCode::UnknownInstruction:
            return ErrorCategory::Validation;
        case ErrorCode::Unauthorized:
        case ErrorCode::UnauthorizedJudge:
        case ErrorCode::InvalidSignature:
        case ErrorCode::InvalidDecisionHash:
            return ErrorCategory::Authorization;
        case ErrorCode::EntryAlreadyExists:
        case ErrorCode::StaleInstruction:
        case ErrorCode::InvalidTimestamp:
        case ErrorCode::TimestampOutOfRange:
            return ErrorCategory::ReplayFreshness;
        case ErrorCode::LedgerNotInitialized:
        case ErrorCode::LedgerAlreadyInitialized:
        case ErrorCode::LedgerInactive:
        case ErrorCode::ReentrancyDetected:
        case ErrorCode::EscapePlanNotReady:
        case ErrorCode::NoParticipants:
        case ErrorCode::RecoveryCooldownActive:
        case ErrorCode::InsufficientFunds:
            return ErrorCategory::State;
        case ErrorCode::ArithmeticOverflow:
        case ErrorCode::SplitInvariantViolated:
        case ErrorCode::RecoveryAmountExceedsLimit:
            return ErrorCategory::Arithmetic;
    }
    return ErrorCategory::Validation;
}

const char* category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return "validation";
        case ErrorCategory::Authorization: return "authorization";
        case ErrorCategory::ReplayFreshness: return "replay_freshness";
        case ErrorCategory::State: return "state";
        case ErrorCategory::Arithmetic: return "arithmetic";
    }
    return "unknown";
}

bool SettlementError::is_retryable() const {
    if (category() == ErrorCategory::State) {
        return true;
    }
    return code_ == ErrorCode::TimestampOutOfRange;
}

grpc::StatusCode SettlementError::status_code() const {
    switch (category()) {
        case ErrorCategory::Validation:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCategory::Authorization:
            return grpc::StatusCode::PERMISSION_DENIED;
        case ErrorCategory::ReplayFreshness:
            return code_ == ErrorCode::EntryAlreadyExists || code_ == ErrorCode::StaleInstruction
                ? grpc::StatusCode::ALREADY_EXISTS
                : grpc::StatusCode::FAILED_PRECONDITION;
        case ErrorCategory::State:
            return grpc::StatusCode::FAILED_PRECONDITION;
        case ErrorCategory::Arithmetic:
            return grpc::StatusCode::OUT_OF_RANGE;
    }
    return grpc::StatusCode::UNKNOWN;
}

} // namespace vault
