#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include "instruction_codec.hpp"
#include "settlement_service.hpp"
#include "test_support.hpp"

using namespace ledger;
using namespace ledger_test;

// =============================================================================
// Service Fixture
// =============================================================================

class SettlementServiceTest : public ::testing::Test {
protected:
    LedgerHarness h;
    SettlementServiceImpl service{*h.engine, h.verifier};
    grpc::ServerContext context;

    grpc::Status submit(const std::string& instruction, const vault::Ed25519KeyPair& signer,
                        vault::BusinessResponse* response) {
        auto envelope = sign_instruction(signer, h.ledger, h.next_sequence(signer.public_key()), instruction,
                                         "corr-svc");
        return service.Submit(&context, &envelope, response);
    }

    grpc::Status submit(const std::string& instruction, const vault::Ed25519KeyPair& signer) {
        vault::BusinessResponse response;
        return submit(instruction, signer, &response);
    }

    bounty::AccountQuery query(const vault::Address& address) {
        bounty::AccountQuery q;
        q.set_address(vault::to_bytes(address));
        return q;
    }
};

TEST_F(SettlementServiceTest, GetDescriptor_ShouldListLedgerInstructions) {
    vault::GetDescriptorRequest request;
    vault::ComponentDescriptor descriptor;

    auto status = service.GetDescriptor(&context, &request, &descriptor);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(descriptor.name(), "ledger");
    EXPECT_EQ(descriptor.component_type(), "aggregate");
    ASSERT_EQ(descriptor.inputs_size(), 1);
    EXPECT_EQ(descriptor.inputs(0).types_size(), 8);
}

TEST_F(SettlementServiceTest, Submit_SignedInitialize_ShouldReturnCommittedEvent) {
    vault::BusinessResponse response;

    auto status = submit(InstructionCodec::encode(h.initialize_command()), h.authority, &response);

    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.events().cover().correlation_id(), "corr-svc");
    ASSERT_EQ(response.events().pages_size(), 1);
    EXPECT_TRUE(response.events().pages(0).event().Is<bounty::LedgerInitialized>());
}

TEST_F(SettlementServiceTest, Submit_Rejections_ShouldMapToStatusCodes) {
    ASSERT_TRUE(submit(InstructionCodec::encode(h.initialize_command()), h.authority).ok());
    auto entry = InstructionCodec::encode(LedgerHarness::entry_command(500, 1));
    ASSERT_TRUE(submit(entry, h.alice).ok());

    auto replay = submit(entry, h.alice);
    EXPECT_EQ(replay.error_code(), grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(replay.error_message().rfind("EntryAlreadyExists: ", 0), 0u);

    auto below_minimum = submit(InstructionCodec::encode(LedgerHarness::entry_command(1, 2)), h.alice);
    EXPECT_EQ(below_minimum.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    auto recovery = submit(InstructionCodec::encode(LedgerHarness::recovery_command(10)), h.bob);
    EXPECT_EQ(recovery.error_code(), grpc::StatusCode::PERMISSION_DENIED);

    auto escape = submit(InstructionCodec::encode(bounty::ExecuteEscapePlan{}), h.bob);
    EXPECT_EQ(escape.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

TEST_F(SettlementServiceTest, Submit_ReplayedEnvelope_ShouldBeAlreadyExists) {
    ASSERT_TRUE(submit(InstructionCodec::encode(h.initialize_command()), h.authority).ok());
    bounty::SetLedgerActive pause;
    pause.set_active(false);
    auto envelope = sign_instruction(h.authority, h.ledger, h.next_sequence(h.authority.public_key()),
                                     InstructionCodec::encode(pause));
    vault::BusinessResponse response;
    ASSERT_TRUE(service.Submit(&context, &envelope, &response).ok());
    bounty::SetLedgerActive resume;
    resume.set_active(true);
    ASSERT_TRUE(submit(InstructionCodec::encode(resume), h.authority).ok());

    auto replay = service.Submit(&context, &envelope, &response);

    EXPECT_EQ(replay.error_code(), grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(replay.error_message().rfind("StaleInstruction: ", 0), 0u);
    EXPECT_TRUE(h.state().is_active);
}

TEST_F(SettlementServiceTest, Submit_EnvelopeWithAlteredSequence_ShouldBePermissionDenied) {
    ASSERT_TRUE(submit(InstructionCodec::encode(h.initialize_command()), h.authority).ok());
    auto envelope = sign_instruction(h.alice, h.ledger, 1,
                                     InstructionCodec::encode(LedgerHarness::entry_command(500, 1)));
    envelope.set_sequence(2);
    vault::BusinessResponse response;

    auto status = service.Submit(&context, &envelope, &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_EQ(h.state().entry_count, 0u);
}

TEST_F(SettlementServiceTest, Submit_ForgedEnvelope_ShouldBePermissionDenied) {
    auto envelope = sign_instruction(h.alice, h.ledger, 1, InstructionCodec::encode(h.initialize_command()));
    envelope.set_signer(vault::to_bytes(h.authority.public_key()));
    vault::BusinessResponse response;

    auto status = service.Submit(&context, &envelope, &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_FALSE(h.engine->account_exists(h.ledger));
}

TEST_F(SettlementServiceTest, Submit_GarbageInstruction_ShouldBeInvalidArgument) {
    auto status = submit("not an instruction", h.alice);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(SettlementServiceTest, GetLedger_ShouldReturnSnapshotOrNotFound) {
    auto q = query(h.ledger);
    bounty::LedgerSnapshot snapshot;

    EXPECT_EQ(service.GetLedger(&context, &q, &snapshot).error_code(), grpc::StatusCode::NOT_FOUND);

    ASSERT_TRUE(submit(InstructionCodec::encode(h.initialize_command()), h.authority).ok());
    ASSERT_TRUE(service.GetLedger(&context, &q, &snapshot).ok());
    EXPECT_EQ(snapshot.balance(), FLOOR);
    EXPECT_EQ(snapshot.bounty_id(), BOUNTY_ID);
    EXPECT_FALSE(snapshot.processing_lock());
}

TEST_F(SettlementServiceTest, GetEntry_ShouldReturnSnapshotOrNotFound) {
    ASSERT_TRUE(submit(InstructionCodec::encode(h.initialize_command()), h.authority).ok());
    auto q = query(h.entry_address(h.alice.public_key(), 4));
    bounty::EntrySnapshot snapshot;

    EXPECT_EQ(service.GetEntry(&context, &q, &snapshot).error_code(), grpc::StatusCode::NOT_FOUND);

    ASSERT_TRUE(submit(InstructionCodec::encode(LedgerHarness::entry_command(250, 4)), h.alice).ok());
    ASSERT_TRUE(service.GetEntry(&context, &q, &snapshot).ok());
    EXPECT_EQ(snapshot.amount_paid(), 250u);
    EXPECT_EQ(snapshot.nonce(), 4u);
    EXPECT_TRUE(snapshot.live());
}

TEST_F(SettlementServiceTest, Queries_WithMalformedAddress_ShouldBeInvalidArgument) {
    bounty::AccountQuery q;
    q.set_address("short");
    bounty::LedgerSnapshot ledger_snapshot;
    bounty::EntrySnapshot entry_snapshot;

    EXPECT_EQ(service.GetLedger(&context, &q, &ledger_snapshot).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(service.GetEntry(&context, &q, &entry_snapshot).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}
