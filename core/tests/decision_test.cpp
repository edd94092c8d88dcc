#include <gtest/gtest.h>
#include <functional>
#include <string>
#include "vault/crypto.hpp"
#include "vault/decision.hpp"
#include "vault/errors.hpp"
#include "vault/wire.hpp"

using namespace vault;

namespace {

constexpr int64_t NOW = 1700000000;

} // anonymous namespace

// =============================================================================
// Decision Authorization Tests
// =============================================================================

class DecisionAuthorizerTest : public ::testing::Test {
protected:
    Ed25519KeyPair judge = Ed25519KeyPair::from_seed(sha256("judge"));
    Ed25519Verifier verifier;
    DecisionAuthorizer authorizer{verifier, DecisionLimits{}};

    DecisionMessage make_decision(bool is_win = true) {
        DecisionMessage decision;
        decision.participant_message = "please release the funds";
        decision.judge_response = "request denied... just kidding";
        decision.is_win = is_win;
        decision.participant_id = 42;
        decision.session_id = "session_abc-123";
        decision.timestamp = NOW - 10;
        decision.ledger = sha256("ledger");
        decision.winner = sha256("winner");
        return seal(decision);
    }

    /// Recompute hash and signature over the current fields.
    DecisionMessage seal(DecisionMessage decision) {
        Digest hash = DecisionAuthorizer::compute_decision_hash(
            decision.participant_message, decision.judge_response, decision.is_win,
            decision.participant_id, decision.session_id, decision.timestamp);
        decision.content_hash = to_bytes(hash);
        decision.signature = to_bytes(judge.sign(DecisionAuthorizer::signing_message(hash, decision)));
        return decision;
    }

    ErrorCode reject_code(const DecisionMessage& decision) {
        return reject_code(decision, judge.public_key(), judge.public_key());
    }

    ErrorCode reject_code(const DecisionMessage& decision, const Identity& configured, const Identity& presented) {
        try {
            authorizer.authorize(decision, configured, presented, NOW);
        } catch (const SettlementError& e) {
            return e.code();
        }
        ADD_FAILURE() << "decision was accepted";
        return ErrorCode::InvalidInput;
    }
};

TEST_F(DecisionAuthorizerTest, ValidDecision_ShouldReturnContentHash) {
    auto decision = make_decision();

    Digest hash = authorizer.authorize(decision, judge.public_key(), judge.public_key(), NOW);

    EXPECT_EQ(to_bytes(hash), decision.content_hash);
}

TEST_F(DecisionAuthorizerTest, HashPreimage_ShouldMatchDocumentedLayout) {
    ByteWriter preimage;
    preimage.raw("m").u8(0).raw("r").u8(0).u8(1).u64(7).raw("s").i64(99);

    EXPECT_EQ(DecisionAuthorizer::compute_decision_hash("m", "r", true, 7, "s", 99),
              sha256(preimage.bytes()));
}

TEST_F(DecisionAuthorizerTest, NulSeparators_ShouldDistinguishFieldBoundaries) {
    EXPECT_NE(DecisionAuthorizer::compute_decision_hash("ab", "c", true, 1, "s", 1),
              DecisionAuthorizer::compute_decision_hash("a", "bc", true, 1, "s", 1));
}

TEST_F(DecisionAuthorizerTest, EmbeddedNul_ShouldBeRejectedBeforeHashing) {
    // ("a\0b", "c") and ("a", "b\0c") share a preimage.
    EXPECT_EQ(DecisionAuthorizer::compute_decision_hash(std::string("a\0b", 3), "c", true, 1, "s", 1),
              DecisionAuthorizer::compute_decision_hash("a", std::string("b\0c", 3), true, 1, "s", 1));

    auto in_message = make_decision();
    in_message.participant_message = std::string("a\0b", 3);
    auto in_response = make_decision();
    in_response.judge_response = std::string("b\0c", 3);

    EXPECT_EQ(reject_code(seal(in_message)), ErrorCode::InvalidInput);
    EXPECT_EQ(reject_code(seal(in_response)), ErrorCode::InvalidInput);
}

// -----------------------------------------------------------------------------
// Tampering: any field changed after signing must be rejected
// -----------------------------------------------------------------------------

TEST_F(DecisionAuthorizerTest, TamperedFields_ShouldFailHashCheck) {
    std::vector<std::pair<std::string, std::function<void(DecisionMessage&)>>> tampers = {
        {"participant_message", [](DecisionMessage& d) { d.participant_message += "!"; }},
        {"judge_response", [](DecisionMessage& d) { d.judge_response = "YOU WIN"; }},
        {"is_win", [](DecisionMessage& d) { d.is_win = !d.is_win; }},
        {"participant_id", [](DecisionMessage& d) { d.participant_id += 1; }},
        {"session_id", [](DecisionMessage& d) { d.session_id = "session_abc-124"; }},
        {"timestamp", [](DecisionMessage& d) { d.timestamp += 1; }},
        {"content_hash", [](DecisionMessage& d) { d.content_hash[0] ^= 0x01; }},
    };

    for (const auto& [field, tamper] : tampers) {
        auto decision = make_decision();
        tamper(decision);
        EXPECT_EQ(reject_code(decision), ErrorCode::InvalidDecisionHash) << field;
    }
}

TEST_F(DecisionAuthorizerTest, TamperedBindings_ShouldFailSignatureCheck) {
    // Ledger and winner are bound only by the signature
    auto other_ledger = make_decision();
    other_ledger.ledger = sha256("another ledger");
    EXPECT_EQ(reject_code(other_ledger), ErrorCode::InvalidSignature);

    auto other_winner = make_decision();
    other_winner.winner = sha256("thief");
    EXPECT_EQ(reject_code(other_winner), ErrorCode::InvalidSignature);

    auto flipped_bit = make_decision();
    flipped_bit.signature[10] ^= 0x40;
    EXPECT_EQ(reject_code(flipped_bit), ErrorCode::InvalidSignature);
}

TEST_F(DecisionAuthorizerTest, ContentHashWrongLength_ShouldFailHashCheck) {
    auto decision = make_decision();
    decision.content_hash.pop_back();
    EXPECT_EQ(reject_code(decision), ErrorCode::InvalidDecisionHash);
}

TEST_F(DecisionAuthorizerTest, SignatureWrongLength_ShouldFailSignatureCheck) {
    auto decision = make_decision();
    decision.signature.resize(63);
    EXPECT_EQ(reject_code(decision), ErrorCode::InvalidSignature);
}

TEST_F(DecisionAuthorizerTest, SignedByOtherKey_ShouldFailSignatureCheck) {
    auto impostor = Ed25519KeyPair::from_seed(sha256("impostor"));
    auto decision = make_decision();
    Digest hash = DecisionAuthorizer::compute_decision_hash(
        decision.participant_message, decision.judge_response, decision.is_win,
        decision.participant_id, decision.session_id, decision.timestamp);
    decision.signature = to_bytes(impostor.sign(DecisionAuthorizer::signing_message(hash, decision)));

    EXPECT_EQ(reject_code(decision), ErrorCode::InvalidSignature);
}

// -----------------------------------------------------------------------------
// Shape
// -----------------------------------------------------------------------------

TEST_F(DecisionAuthorizerTest, MessageAtLimit_ShouldPass) {
    auto decision = make_decision();
    decision.participant_message = std::string(5000, 'a');
    decision.judge_response = std::string(5000, 'b');
    decision.session_id = std::string(100, 's');
    decision = seal(decision);

    EXPECT_NO_THROW(authorizer.authorize(decision, judge.public_key(), judge.public_key(), NOW));
}

TEST_F(DecisionAuthorizerTest, OverlongFields_ShouldBeInputTooLong) {
    auto message = make_decision();
    message.participant_message = std::string(5001, 'a');
    EXPECT_EQ(reject_code(seal(message)), ErrorCode::InputTooLong);

    auto response = make_decision();
    response.judge_response = std::string(5001, 'b');
    EXPECT_EQ(reject_code(seal(response)), ErrorCode::InputTooLong);

    auto session = make_decision();
    session.session_id = std::string(101, 's');
    EXPECT_EQ(reject_code(seal(session)), ErrorCode::InputTooLong);
}

TEST_F(DecisionAuthorizerTest, SessionIdCharset_ShouldBeEnforced) {
    for (const std::string bad : {"has space", "semi;colon", "slash/", "dot.", "uni\xc3\xa9"}) {
        auto decision = make_decision();
        decision.session_id = bad;
        EXPECT_EQ(reject_code(seal(decision)), ErrorCode::InvalidSessionId) << bad;
    }
    EXPECT_TRUE(is_valid_session_id(""));
    EXPECT_TRUE(is_valid_session_id("AZaz09_-"));
}

TEST_F(DecisionAuthorizerTest, ZeroParticipantId_ShouldBeInvalidInput) {
    auto decision = make_decision();
    decision.participant_id = 0;
    EXPECT_EQ(reject_code(seal(decision)), ErrorCode::InvalidInput);
}

// -----------------------------------------------------------------------------
// Freshness
// -----------------------------------------------------------------------------

TEST_F(DecisionAuthorizerTest, NonPositiveTimestamp_ShouldBeInvalidTimestamp) {
    auto zero = make_decision();
    zero.timestamp = 0;
    EXPECT_EQ(reject_code(seal(zero)), ErrorCode::InvalidTimestamp);

    auto negative = make_decision();
    negative.timestamp = -5;
    EXPECT_EQ(reject_code(seal(negative)), ErrorCode::InvalidTimestamp);
}

TEST_F(DecisionAuthorizerTest, FreshnessWindow_ShouldBeInclusive) {
    auto oldest = make_decision();
    oldest.timestamp = NOW - 3600;
    EXPECT_NO_THROW(authorizer.authorize(seal(oldest), judge.public_key(), judge.public_key(), NOW));

    auto newest = make_decision();
    newest.timestamp = NOW + 3600;
    EXPECT_NO_THROW(authorizer.authorize(seal(newest), judge.public_key(), judge.public_key(), NOW));
}

TEST_F(DecisionAuthorizerTest, StaleOrFutureDecision_ShouldBeOutOfRange) {
    auto stale = make_decision();
    stale.timestamp = NOW - 3601;
    EXPECT_EQ(reject_code(seal(stale)), ErrorCode::TimestampOutOfRange);

    auto future = make_decision();
    future.timestamp = NOW + 3601;
    EXPECT_EQ(reject_code(seal(future)), ErrorCode::TimestampOutOfRange);
}

// -----------------------------------------------------------------------------
// Judge identity
// -----------------------------------------------------------------------------

TEST_F(DecisionAuthorizerTest, DefaultJudgeAuthority_ShouldBeInvalidIdentity) {
    auto decision = make_decision();
    EXPECT_EQ(reject_code(decision, Identity{}, judge.public_key()), ErrorCode::InvalidIdentity);
}

TEST_F(DecisionAuthorizerTest, PresentedJudgeMismatch_ShouldBeUnauthorizedJudge) {
    auto decision = make_decision();
    EXPECT_EQ(reject_code(decision, judge.public_key(), sha256("someone else")), ErrorCode::UnauthorizedJudge);
}

TEST_F(DecisionAuthorizerTest, ChecksRunInOrder) {
    // Stale AND wrong judge AND bad hash: freshness is reported first
    auto decision = make_decision();
    decision.timestamp = NOW - 100000;
    decision.content_hash = std::string(32, '\0');
    EXPECT_EQ(reject_code(decision, judge.public_key(), sha256("someone else")),
              ErrorCode::TimestampOutOfRange);
}

// -----------------------------------------------------------------------------
// Verifier seam
// -----------------------------------------------------------------------------

class RecordingVerifier : public SignatureVerifier {
public:
    bool verify(const std::string& message, const std::string& signature,
                const Identity& expected_signer) const override {
        last_message = message;
        last_signer = expected_signer;
        (void)signature;
        return accept;
    }

    bool accept = true;
    mutable std::string last_message;
    mutable Identity last_signer{};
};

TEST_F(DecisionAuthorizerTest, Verifier_ShouldReceiveCanonicalMessageAndConfiguredJudge) {
    RecordingVerifier recording;
    DecisionAuthorizer seam_authorizer(recording, DecisionLimits{});
    auto decision = make_decision();

    Digest hash = seam_authorizer.authorize(decision, judge.public_key(), judge.public_key(), NOW);

    EXPECT_EQ(recording.last_message, DecisionAuthorizer::signing_message(hash, decision));
    EXPECT_EQ(recording.last_signer, judge.public_key());
    EXPECT_EQ(recording.last_message.rfind(DecisionAuthorizer::SIGNING_DOMAIN, 0), 0u);
}

TEST_F(DecisionAuthorizerTest, VerifierRejects_ShouldBeInvalidSignature) {
    RecordingVerifier recording;
    recording.accept = false;
    DecisionAuthorizer seam_authorizer(recording, DecisionLimits{});

    try {
        seam_authorizer.authorize(make_decision(), judge.public_key(), judge.public_key(), NOW);
        FAIL() << "expected SettlementError";
    } catch (const SettlementError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidSignature);
        EXPECT_EQ(e.category(), ErrorCategory::Authorization);
    }
}

TEST_F(DecisionAuthorizerTest, CustomLimits_ShouldBeHonoured) {
    DecisionLimits tight;
    tight.max_message_length = 10;
    tight.max_session_id_length = 4;
    tight.freshness_window_seconds = 5;
    DecisionAuthorizer strict(verifier, tight);

    auto decision = make_decision();
    decision.participant_message = "short";
    decision.judge_response = "short";
    decision.session_id = "abcd";
    decision.timestamp = NOW - 5;
    EXPECT_NO_THROW(strict.authorize(seal(decision), judge.public_key(), judge.public_key(), NOW));

    decision.timestamp = NOW - 6;
    EXPECT_THROW(strict.authorize(seal(decision), judge.public_key(), judge.public_key(), NOW), SettlementError);
}
