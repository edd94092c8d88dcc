#include "vault/decision.hpp"
#include "vault/errors.hpp"
#include "vault/wire.hpp"
#include <algorithm>

namespace vault {

namespace {

bool is_session_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

} // anonymous namespace

bool is_valid_session_id(const std::string& session_id) {
    return std::all_of(session_id.begin(), session_id.end(), is_session_char);
}

void DecisionAuthorizer::validate_shape(const DecisionMessage& decision) const {
    if (decision.participant_message.size() > limits_.max_message_length) {
        throw SettlementError(ErrorCode::InputTooLong,
                              "participant_message exceeds " + std::to_string(limits_.max_message_length) +
                                  " bytes");
    }
    if (decision.judge_response.size() > limits_.max_message_length) {
        throw SettlementError(ErrorCode::InputTooLong,
                              "judge_response exceeds " + std::to_string(limits_.max_message_length) +
                                  " bytes");
    }
    // NUL separates the messages in the hash preimage.
    if (decision.participant_message.find('\0') != std::string::npos ||
        decision.judge_response.find('\0') != std::string::npos) {
        throw SettlementError::invalid_input("decision messages may not contain NUL bytes");
    }
    if (decision.session_id.size() > limits_.max_session_id_length) {
        throw SettlementError(ErrorCode::InputTooLong,
                              "session_id exceeds " + std::to_string(limits_.max_session_id_length) +
                                  " bytes");
    }
    if (!is_valid_session_id(decision.session_id)) {
        throw SettlementError(ErrorCode::InvalidSessionId,
                              "session_id may only contain [A-Za-z0-9_-]");
    }
    if (decision.participant_id == 0) {
        throw SettlementError::invalid_input("participant_id must be positive");
    }
}

void DecisionAuthorizer::validate_freshness(int64_t timestamp, int64_t now) const {
    if (timestamp <= 0) {
        throw SettlementError(ErrorCode::InvalidTimestamp, "decision timestamp must be positive");
    }
    // Compare without forming |now - timestamp|, which can overflow.
    bool too_old = now > timestamp && now - timestamp > limits_.freshness_window_seconds;
    bool too_new = timestamp > now && timestamp - now > limits_.freshness_window_seconds;
    if (too_old || too_new) {
        throw SettlementError(ErrorCode::TimestampOutOfRange,
                              "decision timestamp " + std::to_string(timestamp) + " is outside " +
                                  std::to_string(limits_.freshness_window_seconds) + "s of " +
                                  std::to_string(now));
    }
}

Digest DecisionAuthorizer::authorize(const DecisionMessage& decision,
                                     const Identity& judge_authority,
                                     const Identity& presented_judge,
                                     int64_t now) const {
    validate_shape(decision);
    validate_freshness(decision.timestamp, now);

    if (is_default(judge_authority)) {
        throw SettlementError(ErrorCode::InvalidIdentity, "judge authority is not configured");
    }
    if (presented_judge != judge_authority) {
        throw SettlementError(ErrorCode::UnauthorizedJudge,
                              "judge " + to_hex(presented_judge) + " is not the configured authority");
    }

    Digest expected = compute_decision_hash(decision.participant_message, decision.judge_response,
                                            decision.is_win, decision.participant_id,
                                            decision.session_id, decision.timestamp);
    if (!constant_time_equal(to_bytes(expected), decision.content_hash)) {
        throw SettlementError(ErrorCode::InvalidDecisionHash, "content hash does not match decision");
    }

    if (decision.signature.size() != SIGNATURE_BYTES) {
        throw SettlementError(ErrorCode::InvalidSignature,
                              "signature must be 64 bytes, got " + std::to_string(decision.signature.size()));
    }
    if (!verifier_.verify(signing_message(expected, decision), decision.signature, judge_authority)) {
        throw SettlementError(ErrorCode::InvalidSignature, "judge signature verification failed");
    }

    return expected;
}

Digest DecisionAuthorizer::compute_decision_hash(const std::string& participant_message,
                                                 const std::string& judge_response,
                                                 bool is_win,
                                                 uint64_t participant_id,
                                                 const std::string& session_id,
                                                 int64_t timestamp) {
    ByteWriter preimage;
    preimage.raw(participant_message)
        .u8(0)
        .raw(judge_response)
        .u8(0)
        .boolean(is_win)
        .u64(participant_id)
        .raw(session_id)
        .i64(timestamp);
    return sha256(preimage.bytes());
}

std::string DecisionAuthorizer::signing_message(const Digest& hash, const DecisionMessage& decision) {
    ByteWriter message;
    message.raw(SIGNING_DOMAIN)
        .fixed(hash)
        .boolean(decision.is_win)
        .u64(decision.participant_id)
        .string(decision.session_id)
        .i64(decision.timestamp)
        .fixed(decision.ledger)
        .fixed(decision.winner);
    return message.take();
}

} // namespace vault
