#pragma once

#include <cstdint>
#include <google/protobuf/any.pb.h>
#include "vault/keys.hpp"
#include "vault/types.pb.h"
#include "bounty/ledger.pb.h"

namespace ledger {

/// Ledger account state, rebuilt from the ledger's event book.
struct LedgerState {
    bool initialized = false;
    uint64_t bounty_id = 0;
    vault::Identity authority{};
    vault::Identity judge_authority{};
    vault::Identity side_pocket{};
    uint64_t balance = 0;
    uint64_t reserve = 0;  // held in the ledger account, outside the pool
    uint64_t floor_amount = 0;
    uint64_t minimum_entry = 0;
    uint64_t entry_count = 0;
    int64_t last_activity_time = 0;
    int64_t last_recovery_time = 0;
    bool is_active = false;
    vault::Identity last_participant{};
    uint64_t round = 0;

    // Lifetime counters
    uint64_t lifetime_entries = 0;
    uint64_t decisions_evaluated = 0;
    uint64_t total_side_pocket = 0;
    uint64_t total_paid_out = 0;

    bool exists() const { return initialized; }

    /// Build state from an EventBook by applying all events.
    static LedgerState from_event_book(const vault::EventBook& event_book);

    /// Apply a single event to the state.
    static void apply_event(LedgerState& state, const google::protobuf::Any& event_any);

    /// Read-side view. The processing flag is owned by the engine.
    bounty::LedgerSnapshot to_snapshot(const vault::Address& address, bool processing_lock) const;
};

/// Copy a 32-byte key out of event bytes; malformed bytes give the default key.
vault::Key32 key_or_default(const std::string& bytes);

} // namespace ledger
