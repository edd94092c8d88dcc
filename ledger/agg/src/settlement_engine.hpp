#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "entry_state.hpp"
#include "instruction_context.hpp"
#include "ledger_state.hpp"
#include "value_transfer.hpp"
#include "vault/clock.hpp"
#include "vault/command_router.hpp"
#include "vault/config.hpp"
#include "vault/crypto.hpp"
#include "vault/decision.hpp"
#include "vault/types.pb.h"

namespace ledger {

constexpr const char* LEDGER_DOMAIN = "ledger";
constexpr const char* ENTRY_DOMAIN = "entry";

using LedgerRouter = vault::CommandRouter<LedgerState, InstructionContext>;

/// Command router with every ledger instruction registered.
LedgerRouter create_router();

/**
 * In-process settlement substrate.
 *
 * Holds the event book of every account and executes instructions one
 * ledger at a time:
 *   lock ledger -> check signer sequence -> rebuild state -> dispatch
 *     -> transfer batch -> append events
 *
 * A rejection at any step leaves books and balances untouched, and no
 * account is created for an instruction that does not commit.
 */
class SettlementEngine {
public:
    SettlementEngine(const vault::SettlementConfig& config,
                     ValueTransfer& bank,
                     const vault::SignatureVerifier& verifier,
                     const vault::Clock& clock);

    SettlementEngine(const SettlementEngine&) = delete;
    SettlementEngine& operator=(const SettlementEngine&) = delete;

    /**
     * Execute one instruction against the ledger named by the cover root.
     *
     * @return the committed ledger events.
     * @throws SettlementError if the instruction is rejected.
     */
    vault::EventBook execute(const vault::CommandBook& command);

    bool account_exists(const vault::Address& address) const;

    /// Full event history of an account (empty book if unknown).
    vault::EventBook event_book(const vault::Address& address) const;

    /// Number of accounts that hold a committed history.
    std::size_t account_count() const;

    LedgerState ledger_state(const vault::Address& address) const;

    /// @throws SettlementError LedgerNotInitialized if no ledger lives there.
    bounty::LedgerSnapshot ledger_snapshot(const vault::Address& address) const;

    /// @throws SettlementError InvalidInput if no entry lives there.
    bounty::EntrySnapshot entry_snapshot(const vault::Address& address) const;

    const vault::AddressDeriver& addresses() const { return addresses_; }
    const LedgerRouter& router() const { return router_; }
    const vault::SettlementConfig& config() const { return config_; }

private:
    struct AccountSlot {
        vault::EventBook book;
        std::recursive_mutex mutex;
        bool processing = false;
    };

    /// Holds a processing flag for the whole critical section.
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(bool& flag) : flag_(flag) { flag_ = true; }
        ~ProcessingGuard() { flag_ = false; }
        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;

    private:
        bool& flag_;
    };

    vault::EventBook process(const vault::CommandBook& command);

    /// Lock the slot, check reentrancy and the signer sequence, then dispatch and commit.
    vault::EventBook run(AccountSlot& slot, const vault::Address& ledger,
                         const vault::Identity& signer, const vault::CommandBook& command);

    static std::unique_ptr<AccountSlot> new_slot(const vault::Address& address, const std::string& domain);
    AccountSlot& slot_for(const vault::Address& address, const std::string& domain);
    AccountSlot* find_slot(const vault::Address& address) const;
    void publish(const vault::Address& address, std::unique_ptr<AccountSlot> slot);

    vault::EventBook commit(AccountSlot& ledger_slot, const vault::Address& ledger,
                            const google::protobuf::Message& event, const vault::CommandBook& command,
                            int64_t now);

    const vault::SettlementConfig& config_;
    ValueTransfer& bank_;
    const vault::Clock& clock_;
    vault::AddressDeriver addresses_;
    vault::DecisionAuthorizer authorizer_;
    LedgerRouter router_;

    std::recursive_mutex initialize_mutex_;
    bool initializing_ = false;

    mutable std::mutex accounts_mutex_;
    std::map<vault::Address, std::unique_ptr<AccountSlot>> accounts_;
};

/// Highest signer sequence the signer committed in a book (0 if none).
uint64_t last_signer_sequence(const vault::EventBook& book, const vault::Identity& signer);

/// Transfers a handler attached to its event (empty if it has none).
std::vector<bounty::Transfer> transfers_of(const google::protobuf::Message& event);

} // namespace ledger
