#include "initialize_handler.hpp"
#include "../src/value_transfer.hpp"
#include "vault/errors.hpp"
#include "vault/validation.hpp"

namespace ledger {
namespace handlers {

namespace {

struct InitializeParams {
    vault::Identity authority;
    vault::Identity judge_authority;
    vault::Identity side_pocket;
};

void guard(const LedgerState& state) {
    vault::validation::require_not_exists(state.exists(), vault::ErrorCode::LedgerAlreadyInitialized,
                                          "ledger already initialized");
}

InitializeParams validate(const bounty::InitializeLedger& cmd, const InstructionContext& ctx) {
    if (ctx.addresses.ledger_address(cmd.bounty_id()) != ctx.ledger) {
        throw vault::SettlementError::invalid_input("ledger address is not derived from bounty_id " +
                                                    std::to_string(cmd.bounty_id()));
    }
    vault::validation::require_positive(cmd.floor_amount(), "floor_amount");

    InitializeParams params;
    params.authority = vault::identity_from_bytes(cmd.authority(), "authority");
    params.judge_authority = vault::identity_from_bytes(cmd.judge_authority(), "judge_authority");
    params.side_pocket = vault::identity_from_bytes(cmd.side_pocket(), "side_pocket");
    return params;
}

bounty::LedgerInitialized compute(const bounty::InitializeLedger& cmd, const InitializeParams& params,
                                  const InstructionContext& ctx) {
    bounty::LedgerInitialized event;
    event.set_bounty_id(cmd.bounty_id());
    event.set_authority(vault::to_bytes(params.authority));
    event.set_judge_authority(vault::to_bytes(params.judge_authority));
    event.set_side_pocket(vault::to_bytes(params.side_pocket));
    event.set_floor_amount(cmd.floor_amount());
    event.set_minimum_entry(cmd.minimum_entry());
    event.set_reserve_amount(cmd.reserve_amount());
    event.set_initialized_at(ctx.now);
    *event.add_transfers() = make_transfer(ctx.signer, ctx.ledger, cmd.floor_amount(), "floor");
    if (cmd.reserve_amount() > 0) {
        *event.add_transfers() = make_transfer(ctx.signer, ctx.ledger, cmd.reserve_amount(), "reserve");
    }
    return event;
}

} // anonymous namespace

bounty::LedgerInitialized handle_initialize(const bounty::InitializeLedger& cmd, const LedgerState& state,
                                            const InstructionContext& ctx) {
    guard(state);
    auto params = validate(cmd, ctx);
    return compute(cmd, params, ctx);
}

} // namespace handlers
} // namespace ledger
