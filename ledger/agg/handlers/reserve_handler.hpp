#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Top up the re-seed reserve. Any funded signer may contribute.
bounty::ReserveFunded handle_fund_reserve(const bounty::FundReserve& cmd, const LedgerState& state,
                                          const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
