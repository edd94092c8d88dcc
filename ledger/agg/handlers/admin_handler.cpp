#include "admin_handler.hpp"
#include "vault/errors.hpp"
#include "vault/validation.hpp"

namespace ledger {
namespace handlers {

namespace {

void guard(const LedgerState& state, const InstructionContext& ctx) {
    vault::validation::require_exists(state.exists(), vault::ErrorCode::LedgerNotInitialized,
                                      "ledger not initialized");
    vault::validation::require_signer(ctx.signer, state.authority);
}

} // anonymous namespace

bounty::JudgeAuthorityRotated handle_set_judge_authority(const bounty::SetJudgeAuthority& cmd,
                                                         const LedgerState& state,
                                                         const InstructionContext& ctx) {
    guard(state, ctx);
    vault::Identity judge = vault::identity_from_bytes(cmd.judge_authority(), "judge_authority");

    bounty::JudgeAuthorityRotated event;
    event.set_previous_judge_authority(vault::to_bytes(state.judge_authority));
    event.set_judge_authority(vault::to_bytes(judge));
    event.set_rotated_at(ctx.now);
    return event;
}

bounty::LedgerActivationChanged handle_set_ledger_active(const bounty::SetLedgerActive& cmd,
                                                         const LedgerState& state,
                                                         const InstructionContext& ctx) {
    guard(state, ctx);

    bounty::LedgerActivationChanged event;
    event.set_active(cmd.active());
    event.set_changed_at(ctx.now);
    return event;
}

} // namespace handlers
} // namespace ledger
