#include "settlement_service.hpp"
#include "instruction_codec.hpp"
#include "vault/errors.hpp"
#include "vault/logging.hpp"

namespace ledger {

grpc::Status SettlementServiceImpl::GetDescriptor(grpc::ServerContext* context,
                                                  const vault::GetDescriptorRequest* request,
                                                  vault::ComponentDescriptor* response) {
    (void)context;
    (void)request;

    response->set_name(LEDGER_DOMAIN);
    response->set_component_type("aggregate");

    auto* input = response->add_inputs();
    input->set_domain(LEDGER_DOMAIN);
    for (const auto& type : engine_.router().command_types()) {
        input->add_types(type);
    }
    return grpc::Status::OK;
}

grpc::Status SettlementServiceImpl::Submit(grpc::ServerContext* context,
                                           const bounty::SignedInstruction* request,
                                           vault::BusinessResponse* response) {
    (void)context;
    try {
        vault::CommandBook command = open_envelope(*request, verifier_);
        *response->mutable_events() = engine_.execute(command);
        return grpc::Status::OK;
    } catch (const vault::SettlementError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        vault::log_error(LEDGER_DOMAIN, "submit failed", {{"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status SettlementServiceImpl::GetLedger(grpc::ServerContext* context,
                                              const bounty::AccountQuery* request,
                                              bounty::LedgerSnapshot* response) {
    (void)context;
    try {
        *response = engine_.ledger_snapshot(vault::address_from_bytes(request->address()));
        return grpc::Status::OK;
    } catch (const vault::SettlementError& e) {
        if (e.code() == vault::ErrorCode::LedgerNotInitialized) {
            return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
        }
        return e.to_grpc_status();
    }
}

grpc::Status SettlementServiceImpl::GetEntry(grpc::ServerContext* context,
                                             const bounty::AccountQuery* request,
                                             bounty::EntrySnapshot* response) {
    (void)context;
    try {
        vault::Address address = vault::address_from_bytes(request->address());
        if (!engine_.account_exists(address)) {
            return grpc::Status(grpc::StatusCode::NOT_FOUND, "no entry at " + vault::to_hex(address));
        }
        *response = engine_.entry_snapshot(address);
        return grpc::Status::OK;
    } catch (const vault::SettlementError& e) {
        return e.to_grpc_status();
    }
}

} // namespace ledger
