#include "entry_payment_handler.hpp"
#include "../src/value_transfer.hpp"
#include "vault/errors.hpp"
#include "vault/split.hpp"
#include "vault/validation.hpp"

namespace ledger {
namespace handlers {

bounty::EntryAccepted handle_entry_payment(const bounty::ProcessEntryPayment& cmd, const LedgerState& state,
                                           const InstructionContext& ctx) {
    // Guard
    vault::validation::require_exists(state.exists(), vault::ErrorCode::LedgerNotInitialized,
                                      "ledger not initialized");
    if (!state.is_active) {
        throw vault::SettlementError(vault::ErrorCode::LedgerInactive, "ledger is not accepting entries");
    }

    // Validate
    vault::validation::require_positive(cmd.amount(), "amount");
    vault::validation::require_positive(cmd.nonce(), "nonce");
    if (cmd.amount() < state.minimum_entry) {
        throw vault::SettlementError(vault::ErrorCode::InsufficientPayment,
                                     "entry amount " + std::to_string(cmd.amount()) + " is below minimum " +
                                         std::to_string(state.minimum_entry));
    }

    vault::Address entry_address = ctx.addresses.entry_address(ctx.ledger, ctx.signer, cmd.nonce());
    if (ctx.account_exists(entry_address)) {
        throw vault::SettlementError(vault::ErrorCode::EntryAlreadyExists,
                                     "entry " + vault::to_hex(entry_address) + " already exists");
    }

    // Compute
    vault::Split shares = vault::split(cmd.amount(), ctx.config.entry_pool_percent);
    uint64_t new_balance = vault::checked_add(state.balance, shares.primary);
    uint64_t entry_count = vault::checked_add(state.entry_count, 1);

    bounty::EntryAccepted event;
    event.set_owner(vault::to_bytes(ctx.signer));
    event.set_entry_address(vault::to_bytes(entry_address));
    event.set_amount(cmd.amount());
    event.set_nonce(cmd.nonce());
    event.set_pool_share(shares.primary);
    event.set_side_share(shares.secondary);
    event.set_new_balance(new_balance);
    event.set_entry_count(entry_count);
    event.set_round(state.round);
    event.set_accepted_at(ctx.now);

    if (shares.primary > 0) {
        *event.add_transfers() = make_transfer(ctx.signer, ctx.ledger, shares.primary, "entry pool share");
    }
    if (shares.secondary > 0) {
        *event.add_transfers() = make_transfer(ctx.signer, state.side_pocket, shares.secondary, "side pocket share");
    }
    return event;
}

} // namespace handlers
} // namespace ledger
