#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "settlement_engine.hpp"
#include "settlement_service.hpp"
#include "value_transfer.hpp"
#include "vault/clock.hpp"
#include "vault/config.hpp"
#include "vault/crypto.hpp"
#include "vault/errors.hpp"
#include "vault/logging.hpp"

namespace {

/// --config <path> wins over VAULT_CONFIG; neither means defaults.
std::string config_path(int argc, char** argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    if (const char* env = std::getenv("VAULT_CONFIG")) {
        return env;
    }
    return "";
}

vault::SettlementConfig load(int argc, char** argv) {
    std::string path = config_path(argc, argv);
    vault::SettlementConfig config = path.empty() ? vault::SettlementConfig::defaults()
                                                  : vault::load_config(path);
    vault::apply_env_overrides(config);
    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    vault::SettlementConfig config;
    try {
        config = load(argc, argv);
    } catch (const vault::ConfigError& e) {
        vault::log_error(ledger::LEDGER_DOMAIN, "invalid configuration", {{"error", e.what()}});
        return EXIT_FAILURE;
    }
    vault::set_min_log_level(config.log_level);

    ledger::InMemoryBank bank(config.genesis_balances);
    vault::Ed25519Verifier verifier;
    vault::SystemClock clock;
    ledger::SettlementEngine engine(config, bank, verifier, clock);
    ledger::SettlementServiceImpl service(engine, verifier);

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    // Enable reflection for debugging
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        vault::log_error(ledger::LEDGER_DOMAIN, "failed to start server", {{"address", server_address}});
        return EXIT_FAILURE;
    }
    vault::log_info(ledger::LEDGER_DOMAIN, "settlement server listening", {
        {"address", server_address},
        {"program_id", vault::to_hex(config.program_id)},
        {"genesis_accounts", config.genesis_balances.size()}
    });

    server->Wait();
    return 0;
}
