#pragma once

#include "../src/instruction_context.hpp"
#include "../src/ledger_state.hpp"
#include "bounty/ledger.pb.h"

namespace ledger {
namespace handlers {

/// Rotate the judge authority. Ledger authority only.
bounty::JudgeAuthorityRotated handle_set_judge_authority(const bounty::SetJudgeAuthority& cmd,
                                                         const LedgerState& state,
                                                         const InstructionContext& ctx);

/// Pause or resume entries and decisions. Ledger authority only.
bounty::LedgerActivationChanged handle_set_ledger_active(const bounty::SetLedgerActive& cmd,
                                                         const LedgerState& state,
                                                         const InstructionContext& ctx);

} // namespace handlers
} // namespace ledger
