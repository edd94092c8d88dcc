#include "vault/config.hpp"
#include "vault/crypto.hpp"
#include "vault/errors.hpp"
#include <cstdlib>
#include <fstream>

namespace vault {

namespace {

template<typename T>
void read_field(const nlohmann::json& doc, const char* key, T& target) {
    if (!doc.contains(key)) {
        return;
    }
    try {
        target = doc.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

Key32 parse_key(const std::string& hex, const std::string& what) {
    try {
        return key_from_hex(hex);
    } catch (const SettlementError& e) {
        throw ConfigError(what + " must be 64 hex characters: " + e.what());
    }
}

void require_percent(uint32_t value, const char* name) {
    if (value > 100) {
        throw ConfigError(std::string(name) + " must be <= 100, got " + std::to_string(value));
    }
}

void require_positive(int64_t value, const char* name) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

} // anonymous namespace

SettlementConfig SettlementConfig::defaults() {
    SettlementConfig config;
    config.program_id = sha256(DEFAULT_PROGRAM_SEED);
    return config;
}

void SettlementConfig::validate() const {
    if (port <= 0 || port > 65535) {
        throw ConfigError("port must be in 1..65535, got " + std::to_string(port));
    }
    if (is_default(program_id)) {
        throw ConfigError("program_id must not be the default key");
    }
    require_positive(freshness_window_seconds, "freshness_window_seconds");
    require_positive(escape_timeout_seconds, "escape_timeout_seconds");
    require_positive(recovery_cooldown_seconds, "recovery_cooldown_seconds");
    require_percent(max_recovery_percent, "max_recovery_percent");
    require_percent(entry_pool_percent, "entry_pool_percent");
    require_percent(escape_last_participant_percent, "escape_last_participant_percent");
    if (max_message_length == 0) {
        throw ConfigError("max_message_length must be positive");
    }
    if (max_session_id_length == 0) {
        throw ConfigError("max_session_id_length must be positive");
    }
}

SettlementConfig parse_config(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("config document must be a JSON object");
    }

    SettlementConfig config = SettlementConfig::defaults();
    read_field(doc, "port", config.port);
    read_field(doc, "freshness_window_seconds", config.freshness_window_seconds);
    read_field(doc, "escape_timeout_seconds", config.escape_timeout_seconds);
    read_field(doc, "recovery_cooldown_seconds", config.recovery_cooldown_seconds);
    read_field(doc, "max_recovery_percent", config.max_recovery_percent);
    read_field(doc, "entry_pool_percent", config.entry_pool_percent);
    read_field(doc, "escape_last_participant_percent", config.escape_last_participant_percent);
    read_field(doc, "max_message_length", config.max_message_length);
    read_field(doc, "max_session_id_length", config.max_session_id_length);

    std::string program_id;
    read_field(doc, "program_id", program_id);
    if (!program_id.empty()) {
        config.program_id = parse_key(program_id, "program_id");
    }

    std::string log_level;
    read_field(doc, "log_level", log_level);
    if (!log_level.empty()) {
        config.log_level = parse_log_level(log_level);
    }

    if (doc.contains("genesis_balances")) {
        const auto& balances = doc.at("genesis_balances");
        if (!balances.is_object()) {
            throw ConfigError("genesis_balances must be an object of identity -> amount");
        }
        for (const auto& item : balances.items()) {
            if (!item.value().is_number_unsigned()) {
                throw ConfigError("genesis balance for " + item.key() + " must be a non-negative integer");
            }
            config.genesis_balances[parse_key(item.key(), "genesis identity")] =
                item.value().get<uint64_t>();
        }
    }

    config.validate();
    return config;
}

SettlementConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return parse_config(doc);
}

void apply_env_overrides(SettlementConfig& config) {
    if (const char* port_env = std::getenv("PORT")) {
        try {
            config.port = std::stoi(port_env);
        } catch (const std::exception&) {
            throw ConfigError(std::string("PORT is not a number: ") + port_env);
        }
    }
    if (const char* level_env = std::getenv("VAULT_LOG_LEVEL")) {
        config.log_level = parse_log_level(level_env);
    }
    config.validate();
}

} // namespace vault
