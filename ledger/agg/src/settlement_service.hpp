#pragma once

#include <grpcpp/grpcpp.h>
#include "settlement_engine.hpp"
#include "vault/crypto.hpp"
#include "bounty/settlement.grpc.pb.h"

namespace ledger {

/// gRPC front of the settlement engine.
class SettlementServiceImpl final : public bounty::SettlementService::Service {
public:
    SettlementServiceImpl(SettlementEngine& engine, const vault::SignatureVerifier& verifier)
        : engine_(engine), verifier_(verifier) {}

    grpc::Status GetDescriptor(grpc::ServerContext* context,
                               const vault::GetDescriptorRequest* request,
                               vault::ComponentDescriptor* response) override;

    grpc::Status Submit(grpc::ServerContext* context,
                        const bounty::SignedInstruction* request,
                        vault::BusinessResponse* response) override;

    grpc::Status GetLedger(grpc::ServerContext* context,
                           const bounty::AccountQuery* request,
                           bounty::LedgerSnapshot* response) override;

    grpc::Status GetEntry(grpc::ServerContext* context,
                          const bounty::AccountQuery* request,
                          bounty::EntrySnapshot* response) override;

private:
    SettlementEngine& engine_;
    const vault::SignatureVerifier& verifier_;
};

} // namespace ledger
