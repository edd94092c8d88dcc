#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace vault {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::atomic<int>& min_log_level() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline void set_min_log_level(LogLevel level) {
    min_log_level().store(static_cast<int>(level));
}

/// Parses "debug", "info", "warn" or "error"; anything else is Info.
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline void log_at(LogLevel level, const std::string& domain, const std::string& message,
                   const nlohmann::json& fields = {}) {
    if (static_cast<int>(level) < min_log_level().load()) {
        return;
    }
    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    std::cout << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Error, domain, message, fields);
}

}  // namespace vault
