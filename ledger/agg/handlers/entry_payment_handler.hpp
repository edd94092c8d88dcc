#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Handle ProcessEntryPayment command.
bounty::EntryAccepted handle_entry_payment(const bounty::ProcessEntryPayment& cmd, const LedgerState& state,
                                           const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
