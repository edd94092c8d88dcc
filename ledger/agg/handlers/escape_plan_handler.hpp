#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Handle ExecuteEscapePlan command.
bounty::EscapePlanExecuted handle_escape_plan(const bounty::ExecuteEscapePlan& cmd, const LedgerState& state,
                                              const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
