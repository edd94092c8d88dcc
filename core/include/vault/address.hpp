#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "vault/keys.hpp"

namespace vault {

/**
 * Deterministic seed-derived account addresses.
 *
 * address = SHA-256("bounty-vault/address" || program_id ||
 *                   for each seed: le32(len) || seed)
 *
 * The same seeds always yield the same address; any change to a seed
 * yields a different one.
 */
class AddressDeriver {
public:
    static constexpr const char* DOMAIN_TAG = "bounty-vault/address";
    static constexpr const char* LEDGER_SEED = "ledger";
    static constexpr const char* ENTRY_SEED = "entry";

    explicit AddressDeriver(const Key32& program_id) : program_id_(program_id) {}

    Address derive(const std::vector<std::string>& seeds) const;

    /// Ledger account of a bounty: seeds ("ledger", le64(bounty_id)).
    Address ledger_address(uint64_t bounty_id) const;

    /// Entry record: seeds ("entry", ledger, owner, le64(nonce)).
    Address entry_address(const Address& ledger, const Identity& owner, uint64_t nonce) const;

    const Key32& program_id() const { return program_id_; }

private:
    Key32 program_id_;
};

} // namespace vault
