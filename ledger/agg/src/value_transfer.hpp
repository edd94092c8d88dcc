#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "vault/keys.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {

/**
 * Native value movement provided by the substrate.
 *
 * A batch executes all-or-nothing: if any transfer fails, no balance
 * changes and the failure is thrown as a SettlementError.
 */
class ValueTransfer {
public:
    virtual ~ValueTransfer() = default;
    virtual void execute(const std::vector<bounty::Transfer>& batch) = 0;
};

/// Build a transfer record between two 32-byte keys.
bounty::Transfer make_transfer(const vault::Key32& from, const vault::Key32& to,
                               uint64_t amount, const std::string& memo);

/// Process-local bank of balances keyed by identity or account address.
class InMemoryBank : public ValueTransfer {
public:
    InMemoryBank() = default;
    explicit InMemoryBank(const std::map<vault::Key32, uint64_t>& genesis);

    void execute(const std::vector<bounty::Transfer>& batch) override;

    void deposit(const vault::Key32& holder, uint64_t amount);
    uint64_t balance_of(const vault::Key32& holder) const;

    /// Sum of all balances; constant across transfers.
    uint64_t total_supply() const;

private:
    mutable std::mutex mutex_;
    std::map<vault::Key32, uint64_t> balances_;
};

} // namespace ledger
