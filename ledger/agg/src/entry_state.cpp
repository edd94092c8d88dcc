#include "entry_state.hpp"
#include "ledger_state.hpp"
#include "vault/state_router.hpp"

namespace ledger {

namespace {

void apply_recorded(EntryState& state, const bounty::EntryRecorded& event) {
    state.recorded = true;
    state.ledger = key_or_default(event.ledger());
    state.owner = key_or_default(event.owner());
    state.amount_paid = event.amount_paid();
    state.nonce = event.nonce();
    state.pool_share = event.pool_share();
    state.side_share = event.side_share();
    state.round = event.round();
    state.created_at = event.created_at();
}

} // anonymous namespace

EntryState EntryState::from_event_book(const vault::EventBook& event_book) {
    static const vault::StateRouter<EntryState> router = [] {
        vault::StateRouter<EntryState> r;
        r.on<bounty::EntryRecorded>(apply_recorded);
        return r;
    }();
    return router.from_event_book(event_book);
}

bounty::EntrySnapshot EntryState::to_snapshot(const vault::Address& address, uint64_t ledger_round) const {
    bounty::EntrySnapshot snapshot;
    snapshot.set_address(vault::to_bytes(address));
    snapshot.set_ledger(vault::to_bytes(ledger));
    snapshot.set_owner(vault::to_bytes(owner));
    snapshot.set_amount_paid(amount_paid);
    snapshot.set_nonce(nonce);
    snapshot.set_pool_share(pool_share);
    snapshot.set_side_share(side_share);
    snapshot.set_round(round);
    snapshot.set_created_at(created_at);
    snapshot.set_live(is_live(ledger_round));
    return snapshot;
}

} // namespace ledger
