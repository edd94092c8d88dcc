#include "escape_plan_handler.hpp"
#include "../src/value_transfer.hpp"
#include "vault/errors.hpp"
#include "vault/split.hpp"
#include "vault/validation.hpp"

namespace ledger {
namespace handlers {

namespace {

void guard(const LedgerState& state, const InstructionContext& ctx) {
    vault::validation::require_exists(state.exists(), vault::ErrorCode::LedgerNotInitialized,
                                      "ledger not initialized");
    if (state.entry_count == 0) {
        throw vault::SettlementError(vault::ErrorCode::NoParticipants, "no entries in the current round");
    }
    int64_t idle = ctx.now - state.last_activity_time;
    if (idle < ctx.config.escape_timeout_seconds) {
        throw vault::SettlementError(vault::ErrorCode::EscapePlanNotReady,
                                     "ledger idle for " + std::to_string(idle) + "s, escape needs " +
                                         std::to_string(ctx.config.escape_timeout_seconds) + "s");
    }
}

} // anonymous namespace

bounty::EscapePlanExecuted handle_escape_plan(const bounty::ExecuteEscapePlan& cmd, const LedgerState& state,
                                              const InstructionContext& ctx) {
    (void)cmd;
    guard(state, ctx);

    vault::Split shares = vault::split(state.balance, ctx.config.escape_last_participant_percent);

    bounty::EscapePlanExecuted event;
    event.set_total_balance(state.balance);
    event.set_last_participant(vault::to_bytes(state.last_participant));
    event.set_last_participant_share(shares.primary);
    event.set_retained(shares.secondary);
    event.set_participants(state.entry_count);
    event.set_executed_at(ctx.now);
    if (shares.primary > 0) {
        *event.add_transfers() =
            make_transfer(ctx.ledger, state.last_participant, shares.primary, "escape last participant");
    }
    return event;
}

} // namespace handlers
} // namespace ledger
