#include "recovery_handler.hpp"
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
    vault::validation::require_signer(ctx.signer, state.authority,
                                      "only the ledger authority may run emergency recovery");
}

uint64_t validate(const bounty::EmergencyRecovery& cmd, const LedgerState& state,
                  const InstructionContext& ctx) {
    vault::validation::require_positive(cmd.amount(), "amount");

    if (state.last_recovery_time > 0) {
        int64_t elapsed = ctx.now - state.last_recovery_time;
        if (elapsed < ctx.config.recovery_cooldown_seconds) {
            throw vault::SettlementError(vault::ErrorCode::RecoveryCooldownActive,
                                         "last recovery " + std::to_string(elapsed) + "s ago, cooldown is " +
                                             std::to_string(ctx.config.recovery_cooldown_seconds) + "s");
        }
    }

    uint64_t max_recovery = vault::percent_of(state.balance, ctx.config.max_recovery_percent);
    if (cmd.amount() > max_recovery) {
        throw vault::SettlementError(vault::ErrorCode::RecoveryAmountExceedsLimit,
                                     "recovery of " + std::to_string(cmd.amount()) + " exceeds limit " +
                                         std::to_string(max_recovery));
    }
    return max_recovery;
}

} // anonymous namespace

bounty::EmergencyRecoveryExecuted handle_recovery(const bounty::EmergencyRecovery& cmd, const LedgerState& state,
                                                  const InstructionContext& ctx) {
    guard(state, ctx);
    uint64_t max_recovery = validate(cmd, state, ctx);

    bounty::EmergencyRecoveryExecuted event;
    event.set_authority(vault::to_bytes(state.authority));
    event.set_amount(cmd.amount());
    event.set_remaining_balance(vault::checked_sub(state.balance, cmd.amount()));
    event.set_max_recovery_allowed(max_recovery);
    event.set_executed_at(ctx.now);
    *event.add_transfers() = make_transfer(ctx.ledger, state.authority, cmd.amount(), "emergency recovery");
    return event;
}

} // namespace handlers
} // namespace ledger
