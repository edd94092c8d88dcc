#include "instruction_codec.hpp"
#include "settlement_engine.hpp"
#include "vault/builder.hpp"
#include "vault/errors.hpp"
#include "vault/helpers.hpp"
#include "vault/wire.hpp"
#include <algorithm>

namespace ledger {

namespace {

constexpr const char* INITIALIZE = "initialize";
constexpr const char* PROCESS_ENTRY_PAYMENT = "process_entry_payment";
constexpr const char* PROCESS_DECISION = "process_decision";
constexpr const char* EXECUTE_ESCAPE_PLAN = "execute_escape_plan";
constexpr const char* EMERGENCY_RECOVERY = "emergency_recovery";
constexpr const char* SET_JUDGE_AUTHORITY = "set_judge_authority";
constexpr const char* SET_LEDGER_ACTIVE = "set_ledger_active";
constexpr const char* FUND_RESERVE = "fund_reserve";

/// Write a bytes field that must be exactly N bytes long.
template<std::size_t N>
void write_fixed(vault::ByteWriter& out, const std::string& value, const char* field) {
    if (value.size() != N) {
        throw vault::SettlementError::invalid_input(std::string(field) + " must be " + std::to_string(N) +
                                                    " bytes, got " + std::to_string(value.size()));
    }
    out.raw(value);
}

vault::ByteWriter start(const char* name) {
    vault::ByteWriter out;
    out.fixed(InstructionCodec::discriminator(name));
    return out;
}

template<typename T>
google::protobuf::Any finish(vault::ByteReader& in, const T& cmd) {
    in.expect_end();
    return vault::helpers::pack_any(cmd);
}

} // anonymous namespace

Discriminator InstructionCodec::discriminator(const std::string& instruction_name) {
    vault::Digest digest = vault::sha256("global:" + instruction_name);
    Discriminator out{};
    std::copy(digest.begin(), digest.begin() + out.size(), out.begin());
    return out;
}

std::string InstructionCodec::encode(const bounty::InitializeLedger& cmd) {
    auto out = start(INITIALIZE);
    out.u64(cmd.bounty_id()).u64(cmd.floor_amount());
    write_fixed<vault::KEY_BYTES>(out, cmd.authority(), "authority");
    write_fixed<vault::KEY_BYTES>(out, cmd.judge_authority(), "judge_authority");
    write_fixed<vault::KEY_BYTES>(out, cmd.side_pocket(), "side_pocket");
    out.u64(cmd.minimum_entry()).u64(cmd.reserve_amount());
    return out.take();
}

std::string InstructionCodec::encode(const bounty::ProcessEntryPayment& cmd) {
    return start(PROCESS_ENTRY_PAYMENT).u64(cmd.amount()).u64(cmd.nonce()).take();
}

std::string InstructionCodec::encode(const bounty::ProcessDecision& cmd) {
    auto out = start(PROCESS_DECISION);
    out.string(cmd.participant_message()).string(cmd.judge_response());
    write_fixed<vault::DIGEST_BYTES>(out, cmd.content_hash(), "content_hash");
    write_fixed<vault::SIGNATURE_BYTES>(out, cmd.signature(), "signature");
    out.boolean(cmd.is_win()).u64(cmd.participant_id()).string(cmd.session_id()).i64(cmd.timestamp());
    write_fixed<vault::KEY_BYTES>(out, cmd.judge(), "judge");
    write_fixed<vault::KEY_BYTES>(out, cmd.winner(), "winner");
    return out.take();
}

std::string InstructionCodec::encode(const bounty::ExecuteEscapePlan&) {
    return start(EXECUTE_ESCAPE_PLAN).take();
}

std::string InstructionCodec::encode(const bounty::EmergencyRecovery& cmd) {
    return start(EMERGENCY_RECOVERY).u64(cmd.amount()).take();
}

std::string InstructionCodec::encode(const bounty::SetJudgeAuthority& cmd) {
    auto out = start(SET_JUDGE_AUTHORITY);
    write_fixed<vault::KEY_BYTES>(out, cmd.judge_authority(), "judge_authority");
    return out.take();
}

std::string InstructionCodec::encode(const bounty::SetLedgerActive& cmd) {
    return start(SET_LEDGER_ACTIVE).boolean(cmd.active()).take();
}

std::string InstructionCodec::encode(const bounty::FundReserve& cmd) {
    return start(FUND_RESERVE).u64(cmd.amount()).take();
}

google::protobuf::Any InstructionCodec::decode(const std::string& instruction) {
    vault::ByteReader in(instruction);
    auto tag = in.fixed<8>();

    if (tag == discriminator(INITIALIZE)) {
        bounty::InitializeLedger cmd;
        cmd.set_bounty_id(in.u64());
        cmd.set_floor_amount(in.u64());
        cmd.set_authority(in.raw(vault::KEY_BYTES));
        cmd.set_judge_authority(in.raw(vault::KEY_BYTES));
        cmd.set_side_pocket(in.raw(vault::KEY_BYTES));
        cmd.set_minimum_entry(in.u64());
        cmd.set_reserve_amount(in.u64());
        return finish(in, cmd);
    }
    if (tag == discriminator(PROCESS_ENTRY_PAYMENT)) {
        bounty::ProcessEntryPayment cmd;
        cmd.set_amount(in.u64());
        cmd.set_nonce(in.u64());
        return finish(in, cmd);
    }
    if (tag == discriminator(PROCESS_DECISION)) {
        bounty::ProcessDecision cmd;
        cmd.set_participant_message(in.string(MAX_WIRE_STRING));
        cmd.set_judge_response(in.string(MAX_WIRE_STRING));
        cmd.set_content_hash(in.raw(vault::DIGEST_BYTES));
        cmd.set_signature(in.raw(vault::SIGNATURE_BYTES));
        cmd.set_is_win(in.boolean());
        cmd.set_participant_id(in.u64());
        cmd.set_session_id(in.string(MAX_WIRE_STRING));
        cmd.set_timestamp(in.i64());
        cmd.set_judge(in.raw(vault::KEY_BYTES));
        cmd.set_winner(in.raw(vault::KEY_BYTES));
        return finish(in, cmd);
    }
    if (tag == discriminator(EXECUTE_ESCAPE_PLAN)) {
        return finish(in, bounty::ExecuteEscapePlan{});
    }
    if (tag == discriminator(EMERGENCY_RECOVERY)) {
        bounty::EmergencyRecovery cmd;
        cmd.set_amount(in.u64());
        return finish(in, cmd);
    }
    if (tag == discriminator(SET_JUDGE_AUTHORITY)) {
        bounty::SetJudgeAuthority cmd;
        cmd.set_judge_authority(in.raw(vault::KEY_BYTES));
        return finish(in, cmd);
    }
    if (tag == discriminator(SET_LEDGER_ACTIVE)) {
        bounty::SetLedgerActive cmd;
        cmd.set_active(in.boolean());
        return finish(in, cmd);
    }
    if (tag == discriminator(FUND_RESERVE)) {
        bounty::FundReserve cmd;
        cmd.set_amount(in.u64());
        return finish(in, cmd);
    }

    throw vault::SettlementError(vault::ErrorCode::UnknownInstruction,
                                 "unknown instruction discriminator " + vault::to_hex(tag));
}

std::string envelope_message(const vault::Address& ledger, uint64_t sequence, const std::string& instruction) {
    vault::ByteWriter out;
    out.fixed(ledger).u64(sequence).raw(instruction);
    return out.take();
}

bounty::SignedInstruction sign_instruction(const vault::Ed25519KeyPair& signer,
                                           const vault::Address& ledger,
                                           uint64_t sequence,
                                           const std::string& instruction,
                                           const std::string& correlation_id) {
    bounty::SignedInstruction envelope;
    envelope.set_ledger(vault::to_bytes(ledger));
    envelope.set_signer(vault::to_bytes(signer.public_key()));
    envelope.set_instruction(instruction);
    envelope.set_sequence(sequence);
    envelope.set_signature(vault::to_bytes(signer.sign(envelope_message(ledger, sequence, instruction))));
    envelope.set_correlation_id(correlation_id);
    return envelope;
}

vault::CommandBook open_envelope(const bounty::SignedInstruction& envelope,
                                 const vault::SignatureVerifier& verifier) {
    vault::Address ledger = vault::address_from_bytes(envelope.ledger());
    vault::Identity signer = vault::identity_from_bytes(envelope.signer(), "signer");

    if (!verifier.verify(envelope_message(ledger, envelope.sequence(), envelope.instruction()),
                         envelope.signature(), signer)) {
        throw vault::SettlementError(vault::ErrorCode::InvalidSignature,
                                     "envelope signature does not verify for signer " + vault::to_hex(signer));
    }

    vault::CommandBuilder builder(LEDGER_DOMAIN);
    builder.with_root(ledger)
           .with_signer(signer)
           .with_sequence(envelope.sequence())
           .with_packed_command(InstructionCodec::decode(envelope.instruction()));
    if (!envelope.correlation_id().empty()) {
        builder.with_correlation_id(envelope.correlation_id());
    }
    return builder.build();
}

} // namespace ledger
