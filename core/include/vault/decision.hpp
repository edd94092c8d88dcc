#pragma once

#include <cstdint>
#include <string>
#include "vault/crypto.hpp"
#include "vault/keys.hpp"

namespace vault {

/// Judge verdict presented with ProcessDecision. Never stored.
struct DecisionMessage {
    std::string participant_message;
    std::string judge_response;
    std::string content_hash;   // 32 bytes
    std::string signature;      // 64 bytes
    bool is_win = false;
    uint64_t participant_id = 0;
    std::string session_id;
    int64_t timestamp = 0;
    Address ledger{};
    Identity winner{};
};

struct DecisionLimits {
    std::size_t max_message_length = 5000;
    std::size_t max_session_id_length = 100;
    int64_t freshness_window_seconds = 3600;
};

/**
 * Read-only authorization pipeline for judge decisions.
 *
 * Steps run in order and each is a hard failure:
 *   1. shape (lengths, session id charset, participant id)
 *   2. freshness (timestamp > 0 and within the window of `now`)
 *   3. identity (configured judge is set and matches the presenter)
 *   4. content hash (recomputed, constant-time compare)
 *   5. signature (via the SignatureVerifier seam)
 */
class DecisionAuthorizer {
public:
    static constexpr const char* SIGNING_DOMAIN = "bounty-vault/decision/v1";

    DecisionAuthorizer(const SignatureVerifier& verifier, DecisionLimits limits)
        : verifier_(verifier), limits_(limits) {}

    /**
     * Validate a decision against the ledger's judge authority.
     * @return the recomputed content hash.
     * @throws SettlementError on the first failing step.
     */
    Digest authorize(const DecisionMessage& decision,
                     const Identity& judge_authority,
                     const Identity& presented_judge,
                     int64_t now) const;

    void validate_shape(const DecisionMessage& decision) const;
    void validate_freshness(int64_t timestamp, int64_t now) const;

    /// SHA-256(msg || 0x00 || resp || 0x00 || u8 is_win || le64 id || session || le64 ts)
    static Digest compute_decision_hash(const std::string& participant_message,
                                        const std::string& judge_response,
                                        bool is_win,
                                        uint64_t participant_id,
                                        const std::string& session_id,
                                        int64_t timestamp);

    /// Canonical byte string the judge signs. Binds the hash to the outcome,
    /// the ledger and the winner so a signature cannot be replayed elsewhere.
    static std::string signing_message(const Digest& hash, const DecisionMessage& decision);

    const DecisionLimits& limits() const { return limits_; }

private:
    const SignatureVerifier& verifier_;
    DecisionLimits limits_;
};

/// True if every character is in [A-Za-z0-9_-].
bool is_valid_session_id(const std::string& session_id);

} // namespace vault
