#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Handle EmergencyRecovery command.
bounty::EmergencyRecoveryExecuted handle_recovery(const bounty::EmergencyRecovery& cmd, const LedgerState& state,
                                                  const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
