#include <gtest/gtest.h>
#include "entry_state.hpp"
#include "ledger_state.hpp"
#include "vault/crypto.hpp"
#include "vault/helpers.hpp"

using namespace ledger;

namespace {

vault::Identity key(const std::string& label) {
    return vault::sha256(label);
}

bounty::LedgerInitialized initialized() {
    bounty::LedgerInitialized event;
    event.set_bounty_id(11);
    event.set_authority(vault::to_bytes(key("authority")));
    event.set_judge_authority(vault::to_bytes(key("judge")));
    event.set_side_pocket(vault::to_bytes(key("side")));
    event.set_floor_amount(1000);
    event.set_minimum_entry(50);
    event.set_reserve_amount(3000);
    event.set_initialized_at(100);
    return event;
}

bounty::EntryAccepted accepted(const std::string& owner, uint64_t new_balance, uint64_t count, int64_t at) {
    bounty::EntryAccepted event;
    event.set_owner(vault::to_bytes(key(owner)));
    event.set_amount(500);
    event.set_pool_share(300);
    event.set_side_share(200);
    event.set_new_balance(new_balance);
    event.set_entry_count(count);
    event.set_accepted_at(at);
    return event;
}

} // anonymous namespace

// =============================================================================
// LedgerState
// =============================================================================

TEST(LedgerStateTest, EmptyBook_ShouldNotExist) {
    auto state = LedgerState::from_event_book(vault::EventBook{});

    EXPECT_FALSE(state.exists());
    EXPECT_FALSE(state.is_active);
    EXPECT_EQ(state.balance, 0u);
}

TEST(LedgerStateTest, Initialized_ShouldSeedBalanceWithFloor) {
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized());

    auto state = LedgerState::from_event_book(book);

    EXPECT_TRUE(state.exists());
    EXPECT_TRUE(state.is_active);
    EXPECT_EQ(state.bounty_id, 11u);
    EXPECT_EQ(state.balance, 1000u);
    EXPECT_EQ(state.reserve, 3000u);
    EXPECT_EQ(state.minimum_entry, 50u);
    EXPECT_EQ(state.authority, key("authority"));
    EXPECT_EQ(state.judge_authority, key("judge"));
    EXPECT_EQ(state.last_activity_time, 100);
    EXPECT_EQ(state.last_recovery_time, 0);
}

TEST(LedgerStateTest, Entries_ShouldTrackLastParticipantAndCounters) {
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized(),
                                               accepted("alice", 1300, 1, 150),
                                               accepted("bob", 1600, 2, 180));

    auto state = LedgerState::from_event_book(book);

    EXPECT_EQ(state.balance, 1600u);
    EXPECT_EQ(state.entry_count, 2u);
    EXPECT_EQ(state.last_participant, key("bob"));
    EXPECT_EQ(state.last_activity_time, 180);
    EXPECT_EQ(state.lifetime_entries, 2u);
    EXPECT_EQ(state.total_side_pocket, 400u);
}

TEST(LedgerStateTest, WinningDecision_ShouldStartNewRound) {
    bounty::DecisionProcessed loss;
    loss.set_new_balance(1300);
    bounty::DecisionProcessed win;
    win.set_is_win(true);
    win.set_payout(1300);
    win.set_reseed(1000);
    win.set_new_balance(1000);
    win.set_new_reserve(2000);
    win.set_processed_at(999);
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized(),
                                               accepted("alice", 1300, 1, 150), loss, win);

    auto state = LedgerState::from_event_book(book);

    EXPECT_EQ(state.decisions_evaluated, 2u);
    EXPECT_EQ(state.balance, 1000u);
    EXPECT_EQ(state.reserve, 2000u);
    EXPECT_EQ(state.entry_count, 0u);
    EXPECT_EQ(state.round, 1u);
    EXPECT_EQ(state.total_paid_out, 1300u);
    EXPECT_EQ(state.last_activity_time, 150);
}

TEST(LedgerStateTest, EscapeAndRecovery_ShouldUpdateBalanceAndTimers) {
    bounty::EscapePlanExecuted escape;
    escape.set_last_participant_share(260);
    escape.set_retained(1040);
    escape.set_executed_at(90000);
    bounty::EmergencyRecoveryExecuted recovery;
    recovery.set_amount(104);
    recovery.set_remaining_balance(936);
    recovery.set_executed_at(90500);
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized(),
                                               accepted("alice", 1300, 1, 150), escape, recovery);

    auto state = LedgerState::from_event_book(book);

    EXPECT_EQ(state.balance, 936u);
    EXPECT_EQ(state.entry_count, 0u);
    EXPECT_EQ(state.round, 1u);
    EXPECT_EQ(state.last_activity_time, 90000);
    EXPECT_EQ(state.last_recovery_time, 90500);
    EXPECT_EQ(state.total_paid_out, 260u);
}

TEST(LedgerStateTest, AdminEvents_ShouldRotateJudgeAndToggleActivity) {
    bounty::JudgeAuthorityRotated rotated;
    rotated.set_judge_authority(vault::to_bytes(key("judge-2")));
    bounty::LedgerActivationChanged paused;
    paused.set_active(false);
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized(), rotated, paused);

    auto state = LedgerState::from_event_book(book);

    EXPECT_EQ(state.judge_authority, key("judge-2"));
    EXPECT_FALSE(state.is_active);
}

TEST(LedgerStateTest, ReserveFunded_ShouldRaiseReserveOnly) {
    bounty::ReserveFunded funded;
    funded.set_amount(500);
    funded.set_new_reserve(3500);
    auto book = vault::helpers::new_event_book("ledger", vault::Address{}, initialized(), funded);

    auto state = LedgerState::from_event_book(book);

    EXPECT_EQ(state.reserve, 3500u);
    EXPECT_EQ(state.balance, 1000u);
    EXPECT_EQ(state.to_snapshot(key("ledger"), false).reserve(), 3500u);
}

TEST(LedgerStateTest, ApplyEvent_ShouldAdvanceExistingState) {
    auto state = LedgerState::from_event_book(
        vault::helpers::new_event_book("ledger", vault::Address{}, initialized()));

    LedgerState::apply_event(state, vault::helpers::pack_any(accepted("carol", 1300, 1, 160)));

    EXPECT_EQ(state.balance, 1300u);
    EXPECT_EQ(state.last_participant, key("carol"));
}

TEST(LedgerStateTest, Snapshot_ShouldCarryProcessingFlag) {
    auto state = LedgerState::from_event_book(
        vault::helpers::new_event_book("ledger", vault::Address{}, initialized()));
    vault::Address address = key("ledger");

    auto snapshot = state.to_snapshot(address, true);

    EXPECT_EQ(snapshot.address(), vault::to_bytes(address));
    EXPECT_TRUE(snapshot.processing_lock());
    EXPECT_EQ(snapshot.balance(), 1000u);
    EXPECT_EQ(snapshot.floor_amount(), 1000u);
}

TEST(LedgerStateTest, KeyOrDefault_MalformedBytes_ShouldGiveDefaultKey) {
    EXPECT_TRUE(vault::is_default(key_or_default("")));
    EXPECT_TRUE(vault::is_default(key_or_default("short")));
    EXPECT_EQ(key_or_default(vault::to_bytes(key("x"))), key("x"));
}

// =============================================================================
// EntryState
// =============================================================================

TEST(EntryStateTest, Recorded_ShouldBeLiveOnlyInItsRound) {
    bounty::EntryRecorded recorded;
    recorded.set_ledger(vault::to_bytes(key("ledger")));
    recorded.set_owner(vault::to_bytes(key("alice")));
    recorded.set_amount_paid(500);
    recorded.set_nonce(3);
    recorded.set_round(2);
    recorded.set_created_at(77);
    auto book = vault::helpers::new_event_book("entry", key("entry"), recorded);

    auto entry = EntryState::from_event_book(book);

    EXPECT_TRUE(entry.exists());
    EXPECT_EQ(entry.ledger, key("ledger"));
    EXPECT_EQ(entry.owner, key("alice"));
    EXPECT_EQ(entry.nonce, 3u);
    EXPECT_TRUE(entry.is_live(2));
    EXPECT_FALSE(entry.is_live(3));
    EXPECT_FALSE(entry.to_snapshot(key("entry"), 3).live());
    EXPECT_EQ(entry.to_snapshot(key("entry"), 2).created_at(), 77);
}

TEST(EntryStateTest, EmptyBook_ShouldNotExist) {
    auto entry = EntryState::from_event_book(vault::EventBook{});

    EXPECT_FALSE(entry.exists());
    EXPECT_FALSE(entry.is_live(0));
}
