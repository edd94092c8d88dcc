#include "settlement_engine.hpp"
#include "../handlers/admin_handler.hpp"
#include "../handlers/decision_handler.hpp"
#include "../handlers/entry_payment_handler.hpp"
#include "../handlers/escape_plan_handler.hpp"
#include "../handlers/initialize_handler.hpp"
#include "../handlers/recovery_handler.hpp"
#include "../handlers/reserve_handler.hpp"
#include "vault/errors.hpp"
#include "vault/helpers.hpp"
#include "vault/logging.hpp"

namespace ledger {

LedgerRouter create_router() {
    LedgerRouter router(LEDGER_DOMAIN);
    router.on<bounty::InitializeLedger, bounty::LedgerInitialized>(handlers::handle_initialize)
          .on<bounty::ProcessEntryPayment, bounty::EntryAccepted>(handlers::handle_entry_payment)
          .on<bounty::ProcessDecision, bounty::DecisionProcessed>(handlers::handle_decision)
          .on<bounty::ExecuteEscapePlan, bounty::EscapePlanExecuted>(handlers::handle_escape_plan)
          .on<bounty::EmergencyRecovery, bounty::EmergencyRecoveryExecuted>(handlers::handle_recovery)
          .on<bounty::SetJudgeAuthority, bounty::JudgeAuthorityRotated>(handlers::handle_set_judge_authority)
          .on<bounty::SetLedgerActive, bounty::LedgerActivationChanged>(handlers::handle_set_ledger_active)
          .on<bounty::FundReserve, bounty::ReserveFunded>(handlers::handle_fund_reserve);
    return router;
}

std::vector<bounty::Transfer> transfers_of(const google::protobuf::Message& event) {
    std::vector<bounty::Transfer> transfers;
    const auto* field = event.GetDescriptor()->FindFieldByName("transfers");
    if (field == nullptr || !field->is_repeated() ||
        field->message_type() != bounty::Transfer::descriptor()) {
        return transfers;
    }
    const auto* reflection = event.GetReflection();
    int count = reflection->FieldSize(event, field);
    transfers.reserve(count);
    for (int i = 0; i < count; ++i) {
        transfers.push_back(
            static_cast<const bounty::Transfer&>(reflection->GetRepeatedMessage(event, field, i)));
    }
    return transfers;
}

SettlementEngine::SettlementEngine(const vault::SettlementConfig& config,
                                   ValueTransfer& bank,
                                   const vault::SignatureVerifier& verifier,
                                   const vault::Clock& clock)
    : config_(config),
      bank_(bank),
      clock_(clock),
      addresses_(config.program_id),
      authorizer_(verifier, config.decision_limits()),
      router_(create_router()) {}

std::unique_ptr<SettlementEngine::AccountSlot> SettlementEngine::new_slot(const vault::Address& address,
                                                                          const std::string& domain) {
    auto slot = std::make_unique<AccountSlot>();
    slot->book.mutable_cover()->set_domain(domain);
    slot->book.mutable_cover()->set_root(vault::to_bytes(address));
    return slot;
}

SettlementEngine::AccountSlot& SettlementEngine::slot_for(const vault::Address& address,
                                                          const std::string& domain) {
    std::lock_guard<std::mutex> lock(accounts_mutex_);
    auto& slot = accounts_[address];
    if (!slot) {
        slot = new_slot(address, domain);
    }
    return *slot;
}

SettlementEngine::AccountSlot* SettlementEngine::find_slot(const vault::Address& address) const {
    std::lock_guard<std::mutex> lock(accounts_mutex_);
    auto it = accounts_.find(address);
    return it == accounts_.end() ? nullptr : it->second.get();
}

void SettlementEngine::publish(const vault::Address& address, std::unique_ptr<AccountSlot> slot) {
    std::lock_guard<std::mutex> lock(accounts_mutex_);
    accounts_.emplace(address, std::move(slot));
}

uint64_t last_signer_sequence(const vault::EventBook& book, const vault::Identity& signer) {
    const std::string key = vault::to_bytes(signer);
    uint64_t last = 0;
    for (const auto& page : book.pages()) {
        if (page.signer() == key && page.signer_sequence() > last) {
            last = page.signer_sequence();
        }
    }
    return last;
}

vault::EventBook SettlementEngine::execute(const vault::CommandBook& command) {
    try {
        return process(command);
    } catch (const vault::SettlementError& e) {
        const std::string type_url =
            command.pages_size() > 0 ? command.pages(0).command().type_url() : std::string();
        vault::log_warn(LEDGER_DOMAIN, "instruction rejected", {
            {"command", vault::helpers::type_name_from_url(type_url)},
            {"ledger", vault::to_hex(command.cover().root())},
            {"signer", vault::to_hex(command.signer())},
            {"code", e.code_name()},
            {"category", vault::category_name(e.category())},
            {"reason", e.what()},
            {"correlation_id", command.cover().correlation_id()}
        });
        throw;
    }
}

vault::EventBook SettlementEngine::process(const vault::CommandBook& command) {
    if (command.pages_size() != 1) {
        throw vault::SettlementError(vault::ErrorCode::MalformedInstruction,
                                     "expected exactly one command page, got " +
                                         std::to_string(command.pages_size()));
    }
    const vault::Address ledger = vault::address_from_bytes(command.cover().root());
    const vault::Identity signer = vault::identity_from_bytes(command.signer(), "signer");

    if (!command.pages(0).command().Is<bounty::InitializeLedger>()) {
        AccountSlot* slot = find_slot(ledger);
        if (slot == nullptr) {
            throw vault::SettlementError(vault::ErrorCode::LedgerNotInitialized,
                                         "no ledger at " + vault::to_hex(ledger));
        }
        return run(*slot, ledger, signer, command);
    }

    // A ledger slot becomes visible only once its Initialize commits.
    std::lock_guard<std::recursive_mutex> lock(initialize_mutex_);
    if (initializing_) {
        throw vault::SettlementError(vault::ErrorCode::ReentrancyDetected,
                                     "an initialize is already processing");
    }
    ProcessingGuard initializing(initializing_);

    if (AccountSlot* existing = find_slot(ledger)) {
        return run(*existing, ledger, signer, command);
    }
    auto pending = new_slot(ledger, LEDGER_DOMAIN);
    auto events = run(*pending, ledger, signer, command);
    publish(ledger, std::move(pending));
    return events;
}

vault::EventBook SettlementEngine::run(AccountSlot& slot, const vault::Address& ledger,
                                       const vault::Identity& signer, const vault::CommandBook& command) {
    std::lock_guard<std::recursive_mutex> lock(slot.mutex);

    // The mutex is recursive, so a nested call from this thread gets here.
    if (slot.processing) {
        throw vault::SettlementError(vault::ErrorCode::ReentrancyDetected,
                                     "ledger " + vault::to_hex(ledger) + " is already processing");
    }
    ProcessingGuard processing(slot.processing);

    const uint64_t sequence = command.pages(0).sequence();
    const uint64_t last = last_signer_sequence(slot.book, signer);
    if (sequence <= last) {
        throw vault::SettlementError(vault::ErrorCode::StaleInstruction,
                                     "sequence " + std::to_string(sequence) + " of signer " +
                                         vault::to_hex(signer) + " is not above " + std::to_string(last));
    }

    vault::log_debug(LEDGER_DOMAIN, "instruction dispatched", {
        {"command", vault::helpers::type_name_from_url(command.pages(0).command().type_url())},
        {"ledger", vault::helpers::root_hex(slot.book)},
        {"signer", vault::to_hex(signer)},
        {"sequence", sequence}
    });

    LedgerState state = LedgerState::from_event_book(slot.book);
    const int64_t now = clock_.now();
    InstructionContext ctx{
        ledger,
        signer,
        now,
        config_,
        authorizer_,
        addresses_,
        [this](const vault::Address& address) { return account_exists(address); }
    };

    auto event = router_.dispatch(command.pages(0).command(), state, ctx);
    bank_.execute(transfers_of(*event));
    return commit(slot, ledger, *event, command, now);
}

vault::EventBook SettlementEngine::commit(AccountSlot& ledger_slot, const vault::Address& ledger,
                                          const google::protobuf::Message& event,
                                          const vault::CommandBook& command, int64_t now) {
    vault::EventPage page;
    page.set_sequence(vault::helpers::next_sequence(ledger_slot.book));
    *page.mutable_created_at() = vault::helpers::timestamp_at(now);
    page.mutable_event()->PackFrom(event, vault::helpers::TYPE_URL_PREFIX);
    page.set_signer(command.signer());
    page.set_signer_sequence(command.pages(0).sequence());

    // The entry record is created in the same commit as the ledger update.
    if (const auto* accepted = dynamic_cast<const bounty::EntryAccepted*>(&event)) {
        bounty::EntryRecorded recorded;
        recorded.set_ledger(vault::to_bytes(ledger));
        recorded.set_owner(accepted->owner());
        recorded.set_amount_paid(accepted->amount());
        recorded.set_nonce(accepted->nonce());
        recorded.set_pool_share(accepted->pool_share());
        recorded.set_side_share(accepted->side_share());
        recorded.set_round(accepted->round());
        recorded.set_created_at(accepted->accepted_at());

        vault::Address entry = vault::address_from_bytes(accepted->entry_address());
        AccountSlot& entry_slot = slot_for(entry, ENTRY_DOMAIN);
        std::lock_guard<std::recursive_mutex> entry_lock(entry_slot.mutex);
        auto* entry_page = entry_slot.book.add_pages();
        *entry_page = vault::helpers::pack_event(recorded);
        entry_page->set_sequence(0);
        *entry_page->mutable_created_at() = vault::helpers::timestamp_at(now);
    }

    *ledger_slot.book.add_pages() = page;

    vault::EventBook response;
    response.mutable_cover()->set_domain(LEDGER_DOMAIN);
    response.mutable_cover()->set_root(vault::to_bytes(ledger));
    response.mutable_cover()->set_correlation_id(command.cover().correlation_id());
    *response.add_pages() = page;

    const std::string event_type = event.GetDescriptor()->name();
    nlohmann::json fields = {
        {"event", event_type},
        {"ledger", vault::to_hex(ledger)},
        {"sequence", page.sequence()},
        {"transfers", static_cast<int>(transfers_of(event).size())},
        {"correlation_id", command.cover().correlation_id()}
    };
    if (const auto* recovery = dynamic_cast<const bounty::EmergencyRecoveryExecuted*>(&event)) {
        fields["amount"] = recovery->amount();
        fields["remaining_balance"] = recovery->remaining_balance();
        vault::log_warn(LEDGER_DOMAIN, "emergency recovery executed", fields);
    } else {
        vault::log_info(LEDGER_DOMAIN, "event committed", fields);
    }
    return response;
}

bool SettlementEngine::account_exists(const vault::Address& address) const {
    AccountSlot* slot = find_slot(address);
    if (slot == nullptr) {
        return false;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex);
    return slot->book.pages_size() > 0;
}

vault::EventBook SettlementEngine::event_book(const vault::Address& address) const {
    AccountSlot* slot = find_slot(address);
    if (slot == nullptr) {
        return vault::EventBook{};
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex);
    return slot->book;
}

std::size_t SettlementEngine::account_count() const {
    std::lock_guard<std::mutex> lock(accounts_mutex_);
    return accounts_.size();
}

LedgerState SettlementEngine::ledger_state(const vault::Address& address) const {
    return LedgerState::from_event_book(event_book(address));
}

bounty::LedgerSnapshot SettlementEngine::ledger_snapshot(const vault::Address& address) const {
    AccountSlot* slot = find_slot(address);
    if (slot != nullptr) {
        std::lock_guard<std::recursive_mutex> lock(slot->mutex);
        LedgerState state = LedgerState::from_event_book(slot->book);
        if (state.exists()) {
            return state.to_snapshot(address, slot->processing);
        }
    }
    throw vault::SettlementError(vault::ErrorCode::LedgerNotInitialized,
                                 "no ledger at " + vault::to_hex(address));
}

bounty::EntrySnapshot SettlementEngine::entry_snapshot(const vault::Address& address) const {
    EntryState entry = EntryState::from_event_book(event_book(address));
    if (!entry.exists()) {
        throw vault::SettlementError::invalid_input("no entry at " + vault::to_hex(address));
    }
    LedgerState owner_ledger = ledger_state(entry.ledger);
    return entry.to_snapshot(address, owner_ledger.round);
}

} // namespace ledger
