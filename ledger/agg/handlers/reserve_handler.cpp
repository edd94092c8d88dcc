#include "reserve_handler.hpp"
#include "../src/value_transfer.hpp"
#include "vault/errors.hpp"
#include "vault/split.hpp"
#include "vault/validation.hpp"

namespace ledger {
namespace handlers {

bounty::ReserveFunded handle_fund_reserve(const bounty::FundReserve& cmd, const LedgerState& state,
                                          const InstructionContext& ctx) {
    // Guard
    vault::validation::require_exists(state.exists(), vault::ErrorCode::LedgerNotInitialized,
                                      "ledger not initialized");

    // Validate
    vault::validation::require_positive(cmd.amount(), "amount");

    // Compute
    bounty::ReserveFunded event;
    event.set_funder(vault::to_bytes(ctx.signer));
    event.set_amount(cmd.amount());
    event.set_new_reserve(vault::checked_add(state.reserve, cmd.amount()));
    event.set_funded_at(ctx.now);
    *event.add_transfers() = make_transfer(ctx.signer, ctx.ledger, cmd.amount(), "reserve");
    return event;
}

} // namespace handlers
} // namespace ledger
