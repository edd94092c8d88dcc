#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <google/protobuf/message.h>
#include <google/protobuf/any.pb.h>
#include "vault/errors.hpp"
#include "vault/helpers.hpp"

namespace vault {

/// Functional router for instruction handling.
/// Handlers receive the command, the account state rebuilt by the caller
/// and a per-instruction context (signer, clock reading, collaborators).
template<typename State, typename Context>
class CommandRouter {
public:
    using MessagePtr = std::unique_ptr<google::protobuf::Message>;
    using CommandHandler =
        std::function<MessagePtr(const google::protobuf::Any&, const State&, const Context&)>;

private:
    std::string name_;
    std::unordered_map<std::string, CommandHandler> handlers_;
    std::vector<std::string> command_types_;

public:
    explicit CommandRouter(const std::string& name) : name_(name) {}

    /// Register a command handler.
    template<typename CommandType, typename EventType>
    CommandRouter& on(std::function<EventType(const CommandType&, const State&, const Context&)> handler) {
        const std::string type_name = CommandType::descriptor()->full_name();
        handlers_[type_name] = [handler, type_name](const google::protobuf::Any& any,
                                                    const State& state,
                                                    const Context& ctx) -> MessagePtr {
            CommandType cmd;
            if (!any.UnpackTo(&cmd)) {
                throw SettlementError(ErrorCode::MalformedInstruction,
                                      "cannot decode " + type_name);
            }
            auto event = handler(cmd, state, ctx);
            return std::make_unique<EventType>(std::move(event));
        };
        command_types_.push_back(CommandType::descriptor()->name());
        return *this;
    }

    /// Dispatch a packed command to its handler.
    MessagePtr dispatch(const google::protobuf::Any& command, const State& state, const Context& ctx) const {
        const std::string type_name = helpers::type_name_from_url(command.type_url());
        auto it = handlers_.find(type_name);
        if (it == handlers_.end()) {
            throw SettlementError(ErrorCode::UnknownInstruction,
                                  "no handler for command type: " + type_name);
        }
        return it->second(command, state, ctx);
    }

    bool handles(const std::string& type_name) const {
        return handlers_.count(type_name) > 0;
    }

    /// Short names of registered commands, in registration order.
    const std::vector<std::string>& command_types() const { return command_types_; }

    const std::string& name() const { return name_; }
};

} // namespace vault
