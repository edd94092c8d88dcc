#include "vault/address.hpp"
#include "vault/crypto.hpp"
#include "vault/wire.hpp"

namespace vault {

Address AddressDeriver::derive(const std::vector<std::string>& seeds) const {
    ByteWriter preimage;
    preimage.raw(DOMAIN_TAG).fixed(program_id_);
    for (const auto& seed : seeds) {
        preimage.string(seed);
    }
    return sha256(preimage.bytes());
}

Address AddressDeriver::ledger_address(uint64_t bounty_id) const {
    return derive({LEDGER_SEED, ByteWriter().u64(bounty_id).take()});
}

Address AddressDeriver::entry_address(const Address& ledger, const Identity& owner, uint64_t nonce) const {
    return derive({ENTRY_SEED, to_bytes(ledger), to_bytes(owner), ByteWriter().u64(nonce).take()});
}

} // namespace vault
