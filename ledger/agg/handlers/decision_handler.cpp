#include "decision_handler.hpp"
#include "../src/value_transfer.hpp"
#include "vault/decision.hpp"
#include "vault/errors.hpp"
#include "vault/split.hpp"
#include "vault/validation.hpp"
#include <algorithm>

namespace ledger {
namespace handlers {

namespace {

void guard(const LedgerState& state) {
    vault::validation::require_exists(state.exists(), vault::ErrorCode::LedgerNotInitialized,
                                      "ledger not initialized");
    if (!state.is_active) {
        throw vault::SettlementError(vault::ErrorCode::LedgerInactive, "ledger is not accepting decisions");
    }
}

vault::DecisionMessage to_decision(const bounty::ProcessDecision& cmd, const InstructionContext& ctx) {
    vault::DecisionMessage decision;
    decision.participant_message = cmd.participant_message();
    decision.judge_response = cmd.judge_response();
    decision.content_hash = cmd.content_hash();
    decision.signature = cmd.signature();
    decision.is_win = cmd.is_win();
    decision.participant_id = cmd.participant_id();
    decision.session_id = cmd.session_id();
    decision.timestamp = cmd.timestamp();
    decision.ledger = ctx.ledger;
    decision.winner = key_or_default(cmd.winner());
    return decision;
}

// docs:start:decision_compute
bounty::DecisionProcessed compute(const bounty::ProcessDecision& cmd, const LedgerState& state,
                                  const InstructionContext& ctx, const vault::Digest& hash,
                                  const vault::Identity& winner) {
    bounty::DecisionProcessed event;
    event.set_participant_id(cmd.participant_id());
    event.set_session_id(cmd.session_id());
    event.set_is_win(cmd.is_win());
    event.set_content_hash(vault::to_bytes(hash));
    event.set_decision_timestamp(cmd.timestamp());
    event.set_processed_at(ctx.now);

    if (!cmd.is_win()) {
        event.set_new_balance(state.balance);
        return event;
    }

    vault::validation::require_identity(winner, "winner");
    if (state.balance == 0) {
        throw vault::SettlementError(vault::ErrorCode::InsufficientFunds, "ledger balance is empty");
    }

    // The next round is seeded from the ledger's own reserve; a short
    // reserve seeds less than the floor.
    uint64_t payout = state.balance;
    uint64_t reseed = std::min(state.floor_amount, state.reserve);
    event.set_winner(vault::to_bytes(winner));
    event.set_payout(payout);
    event.set_reseed(reseed);
    event.set_new_balance(reseed);
    event.set_new_reserve(vault::checked_sub(state.reserve, reseed));
    *event.add_transfers() = make_transfer(ctx.ledger, winner, payout, "winner payout");
    return event;
}
// docs:end:decision_compute

} // anonymous namespace

bounty::DecisionProcessed handle_decision(const bounty::ProcessDecision& cmd, const LedgerState& state,
                                          const InstructionContext& ctx) {
    guard(state);

    auto decision = to_decision(cmd, ctx);
    vault::Identity presented_judge = key_or_default(cmd.judge());
    vault::Digest hash = ctx.authorizer.authorize(decision, state.judge_authority, presented_judge, ctx.now);

    return compute(cmd, state, ctx, hash, decision.winner);
}

} // namespace handlers
} // namespace ledger
