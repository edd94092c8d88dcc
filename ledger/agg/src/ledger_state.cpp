#include "ledger_state.hpp"
#include "vault/state_router.hpp"
#include <cstring>

namespace ledger {

namespace {

void apply_initialized(LedgerState& state, const bounty::LedgerInitialized& event) {
    state.initialized = true;
    state.bounty_id = event.bounty_id();
    state.authority = key_or_default(event.authority());
    state.judge_authority = key_or_default(event.judge_authority());
    state.side_pocket = key_or_default(event.side_pocket());
    state.floor_amount = event.floor_amount();
    state.minimum_entry = event.minimum_entry();
    state.balance = event.floor_amount();
    state.reserve = event.reserve_amount();
    state.entry_count = 0;
    state.last_activity_time = event.initialized_at();
    state.last_recovery_time = 0;
    state.is_active = true;
    state.round = 0;
}

void apply_entry(LedgerState& state, const bounty::EntryAccepted& event) {
    state.balance = event.new_balance();
    state.entry_count = event.entry_count();
    state.last_activity_time = event.accepted_at();
    state.last_participant = key_or_default(event.owner());
    state.lifetime_entries += 1;
    state.total_side_pocket += event.side_share();
}

void apply_decision(LedgerState& state, const bounty::DecisionProcessed& event) {
    state.decisions_evaluated += 1;
    if (!event.is_win()) {
        return;
    }
    state.balance = event.new_balance();
    state.reserve = event.new_reserve();
    state.entry_count = 0;
    state.round += 1;
    state.total_paid_out += event.payout();
}

void apply_escape(LedgerState& state, const bounty::EscapePlanExecuted& event) {
    state.balance = event.retained();
    state.entry_count = 0;
    state.last_activity_time = event.executed_at();
    state.round += 1;
    state.total_paid_out += event.last_participant_share();
}

void apply_recovery(LedgerState& state, const bounty::EmergencyRecoveryExecuted& event) {
    state.balance = event.remaining_balance();
    state.last_recovery_time = event.executed_at();
}

void apply_judge_rotated(LedgerState& state, const bounty::JudgeAuthorityRotated& event) {
    state.judge_authority = key_or_default(event.judge_authority());
}

void apply_activation(LedgerState& state, const bounty::LedgerActivationChanged& event) {
    state.is_active = event.active();
}

void apply_reserve_funded(LedgerState& state, const bounty::ReserveFunded& event) {
    state.reserve = event.new_reserve();
}

const vault::StateRouter<LedgerState>& state_router() {
    static const vault::StateRouter<LedgerState> router = [] {
        vault::StateRouter<LedgerState> r;
        r.on<bounty::LedgerInitialized>(apply_initialized)
         .on<bounty::EntryAccepted>(apply_entry)
         .on<bounty::DecisionProcessed>(apply_decision)
         .on<bounty::EscapePlanExecuted>(apply_escape)
         .on<bounty::EmergencyRecoveryExecuted>(apply_recovery)
         .on<bounty::JudgeAuthorityRotated>(apply_judge_rotated)
         .on<bounty::LedgerActivationChanged>(apply_activation)
         .on<bounty::ReserveFunded>(apply_reserve_funded);
        return r;
    }();
    return router;
}

} // anonymous namespace

vault::Key32 key_or_default(const std::string& bytes) {
    vault::Key32 key{};
    if (bytes.size() == key.size()) {
        std::memcpy(key.data(), bytes.data(), key.size());
    }
    return key;
}

LedgerState LedgerState::from_event_book(const vault::EventBook& event_book) {
    return state_router().from_event_book(event_book);
}

void LedgerState::apply_event(LedgerState& state, const google::protobuf::Any& event_any) {
    state_router().apply_single(state, event_any);
}

bounty::LedgerSnapshot LedgerState::to_snapshot(const vault::Address& address, bool processing_lock) const {
    bounty::LedgerSnapshot snapshot;
    snapshot.set_address(vault::to_bytes(address));
    snapshot.set_bounty_id(bounty_id);
    snapshot.set_authority(vault::to_bytes(authority));
    snapshot.set_judge_authority(vault::to_bytes(judge_authority));
    snapshot.set_side_pocket(vault::to_bytes(side_pocket));
    snapshot.set_balance(balance);
    snapshot.set_reserve(reserve);
    snapshot.set_floor_amount(floor_amount);
    snapshot.set_minimum_entry(minimum_entry);
    snapshot.set_entry_count(entry_count);
    snapshot.set_last_activity_time(last_activity_time);
    snapshot.set_processing_lock(processing_lock);
    snapshot.set_last_recovery_time(last_recovery_time);
    snapshot.set_is_active(is_active);
    snapshot.set_last_participant(vault::to_bytes(last_participant));
    snapshot.set_round(round);
    snapshot.set_lifetime_entries(lifetime_entries);
    snapshot.set_decisions_evaluated(decisions_evaluated);
    snapshot.set_total_side_pocket(total_side_pocket);
    snapshot.set_total_paid_out(total_paid_out);
    return snapshot;
}

} // namespace ledger
