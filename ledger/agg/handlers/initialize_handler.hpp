#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Handle InitializeLedger command.
bounty::LedgerInitialized handle_initialize(const bounty::InitializeLedger& cmd, const LedgerState& state,
                                            const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
