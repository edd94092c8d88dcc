#pragma once

#include <cstdint>
#include <functional>
#include "vault/address.hpp"
#include "vault/config.hpp"
#include "vault/decision.hpp"
#include "vault/keys.hpp"

namespace ledger {

/// Per-instruction inputs that are not part of the command itself.
struct InstructionContext {
    vault::Address ledger{};
    vault::Identity signer{};
    int64_t now = 0;
    const vault::SettlementConfig& config;
    const vault::DecisionAuthorizer& authorizer;
    const vault::AddressDeriver& addresses;
    std::function<bool(const vault::Address&)> account_exists;
};

} // namespace ledger
