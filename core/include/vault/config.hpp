#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "vault/decision.hpp"
#include "vault/keys.hpp"
#include "vault/logging.hpp"

namespace vault {

constexpr int DEFAULT_PORT = 50451;
constexpr const char* DEFAULT_PROGRAM_SEED = "bounty-vault";

/// Runtime settings of the settlement engine and its gRPC host.
struct SettlementConfig {
    int port = DEFAULT_PORT;
    Key32 program_id{};
    int64_t freshness_window_seconds = 3600;
    int64_t escape_timeout_seconds = 86400;
    int64_t recovery_cooldown_seconds = 86400;
    uint32_t max_recovery_percent = 10;
    uint32_t entry_pool_percent = 60;
    uint32_t escape_last_participant_percent = 20;
    std::size_t max_message_length = 5000;
    std::size_t max_session_id_length = 100;
    LogLevel log_level = LogLevel::Info;
    /// Opening balances of the in-memory bank, keyed by identity.
    std::map<Key32, uint64_t> genesis_balances;

    /// Defaults with program_id = SHA-256(DEFAULT_PROGRAM_SEED).
    static SettlementConfig defaults();

    DecisionLimits decision_limits() const {
        DecisionLimits limits;
        limits.max_message_length = max_message_length;
        limits.max_session_id_length = max_session_id_length;
        limits.freshness_window_seconds = freshness_window_seconds;
        return limits;
    }

    /// Throws ConfigError on out-of-range values.
    void validate() const;
};

/**
 * Parse a config document. Missing keys keep their defaults.
 * @throws ConfigError on type errors or invalid values.
 */
SettlementConfig parse_config(const nlohmann::json& doc);

/**
 * Load a config file.
 * @throws ConfigError if the file is unreadable or invalid.
 */
SettlementConfig load_config(const std::string& path);

/// Apply PORT and VAULT_LOG_LEVEL from the environment.
void apply_env_overrides(SettlementConfig& config);

} // namespace vault
