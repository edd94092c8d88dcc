#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include "vault/crypto.hpp"
#include "vault/keys.hpp"
#include "vault/types.pb.h"
#include "bounty/ledger.pb.h"
#include "bounty/settlement.pb.h"

namespace ledger {

using Discriminator = std::array<uint8_t, 8>;

/**
 * Binary instruction format.
 *
 * Every instruction is an 8-byte discriminator, SHA-256("global:<name>")
 * truncated, followed by its arguments: fixed-width little-endian
 * integers, one-byte bools, le32-prefixed strings and fixed-size key,
 * hash and signature arrays. Trailing bytes are rejected.
 */
class InstructionCodec {
public:
    /// Upper bound on any encoded string; semantic limits are enforced later.
    static constexpr std::size_t MAX_WIRE_STRING = 64 * 1024;

    static Discriminator discriminator(const std::string& instruction_name);

    static std::string encode(const bounty::InitializeLedger& cmd);
    static std::string encode(const bounty::ProcessEntryPayment& cmd);
    static std::string encode(const bounty::ProcessDecision& cmd);
    static std::string encode(const bounty::ExecuteEscapePlan& cmd);
    static std::string encode(const bounty::EmergencyRecovery& cmd);
    static std::string encode(const bounty::SetJudgeAuthority& cmd);
    static std::string encode(const bounty::SetLedgerActive& cmd);
    static std::string encode(const bounty::FundReserve& cmd);

    /**
     * Decode instruction bytes into the packed command message.
     * @throws SettlementError UnknownInstruction or MalformedInstruction.
     */
    static google::protobuf::Any decode(const std::string& instruction);
};

/// Bytes covered by the envelope signature: ledger || le64(sequence) || instruction.
std::string envelope_message(const vault::Address& ledger, uint64_t sequence, const std::string& instruction);

/**
 * Sign an encoded instruction for a ledger.
 *
 * The engine only accepts a sequence greater than the last one this
 * signer used on the ledger, so a signed envelope executes at most once.
 */
bounty::SignedInstruction sign_instruction(const vault::Ed25519KeyPair& signer,
                                           const vault::Address& ledger,
                                           uint64_t sequence,
                                           const std::string& instruction,
                                           const std::string& correlation_id = "");

/**
 * Verify an envelope and turn it into the CommandBook the engine executes.
 * @throws SettlementError InvalidSignature if the signer did not sign it.
 */
vault::CommandBook open_envelope(const bounty::SignedInstruction& envelope,
                                 const vault::SignatureVerifier& verifier);

} // namespace ledger
