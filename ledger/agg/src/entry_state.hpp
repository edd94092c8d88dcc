#pragma once

#include <cstdint>
#include "vault/keys.hpp"
#include "vault/types.pb.h"
#include "bounty/ledger.pb.h"

namespace ledger {

/// Entry record state. Written once, never mutated.
struct EntryState {
    bool recorded = false;
    vault::Address ledger{};
    vault::Identity owner{};
    uint64_t amount_paid = 0;
    uint64_t nonce = 0;
    uint64_t pool_share = 0;
    uint64_t side_share = 0;
    uint64_t round = 0;
    int64_t created_at = 0;

    bool exists() const { return recorded; }

    /// Live while its round is the ledger's current round.
    bool is_live(uint64_t ledger_round) const { return recorded && round == ledger_round; }

    static EntryState from_event_book(const vault::EventBook& event_book);

    bounty::EntrySnapshot to_snapshot(const vault::Address& address, uint64_t ledger_round) const;
};

} // namespace ledger
