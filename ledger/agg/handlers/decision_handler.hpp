#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/**
 * Handle ProcessDecision command.
 *
 * Runs the decision authorization pipeline against the ledger's judge
 * authority. A win pays the whole balance to the winner and re-seeds the
 * pool with floor_amount from the authority; a loss moves no funds and is
 * recorded for audit only.
 */
bounty::DecisionProcessed handle_decision(const bounty::ProcessDecision& cmd, const LedgerState& state,
                                          const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
