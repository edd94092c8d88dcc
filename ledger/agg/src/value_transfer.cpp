#include "value_transfer.hpp"
#include "vault/errors.hpp"
#include "vault/split.hpp"

namespace ledger {

bounty::Transfer make_transfer(const vault::Key32& from, const vault::Key32& to,
                               uint64_t amount, const std::string& memo) {
    bounty::Transfer transfer;
    transfer.set_from(vault::to_bytes(from));
    transfer.set_to(vault::to_bytes(to));
    transfer.set_amount(amount);
    transfer.set_memo(memo);
    return transfer;
}

InMemoryBank::InMemoryBank(const std::map<vault::Key32, uint64_t>& genesis) {
    for (const auto& [holder, amount] : genesis) {
        deposit(holder, amount);
    }
}

void InMemoryBank::execute(const std::vector<bounty::Transfer>& batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Apply to a working copy of the touched balances; publish only if
    // every transfer succeeds.
    std::map<vault::Key32, uint64_t> working;
    auto balance = [&](const vault::Key32& key) -> uint64_t& {
        auto it = working.find(key);
        if (it == working.end()) {
            auto existing = balances_.find(key);
            it = working.emplace(key, existing == balances_.end() ? 0 : existing->second).first;
        }
        return it->second;
    };

    for (const auto& transfer : batch) {
        vault::Key32 from = vault::address_from_bytes(transfer.from());
        vault::Key32 to = vault::address_from_bytes(transfer.to());

        uint64_t& from_balance = balance(from);
        if (from_balance < transfer.amount()) {
            throw vault::SettlementError(vault::ErrorCode::InsufficientFunds,
                                         "transfer of " + std::to_string(transfer.amount()) + " from " +
                                             vault::to_hex(from) + " exceeds balance " +
                                             std::to_string(from_balance));
        }
        from_balance -= transfer.amount();
        uint64_t& to_balance = balance(to);
        to_balance = vault::checked_add(to_balance, transfer.amount());
    }

    for (const auto& [key, value] : working) {
        balances_[key] = value;
    }
}

void InMemoryBank::deposit(const vault::Key32& holder, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[holder] = vault::checked_add(balances_[holder], amount);
}

uint64_t InMemoryBank::balance_of(const vault::Key32& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

uint64_t InMemoryBank::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& entry : balances_) {
        total = vault::checked_add(total, entry.second);
    }
    return total;
}

} // namespace ledger
