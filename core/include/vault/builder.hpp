#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <google/protobuf/any.pb.h>
#include "vault/errors.hpp"
#include "vault/helpers.hpp"
#include "vault/keys.hpp"
#include "vault/types.pb.h"

namespace vault {

/**
 * Fluent builder for the CommandBook the settlement engine executes.
 *
 * Example:
 *   auto book = CommandBuilder("ledger")
 *       .with_root(ledger_address)
 *       .with_signer(participant)
 *       .with_sequence(12)
 *       .with_correlation_id("corr-123")
 *       .with_command(entry_cmd)
 *       .build();
 */
class CommandBuilder {
public:
    explicit CommandBuilder(const std::string& domain) : domain_(domain) {}

    /**
     * Set the target account address.
     */
    CommandBuilder& with_root(const Address& root) {
        root_ = root;
        return *this;
    }

    /**
     * Set the identity that authorized the command.
     */
    CommandBuilder& with_signer(const Identity& signer) {
        signer_ = signer;
        return *this;
    }

    /**
     * Set the correlation ID for request tracing.
     * If not set, a random one is generated on build.
     */
    CommandBuilder& with_correlation_id(const std::string& id) {
        correlation_id_ = id;
        return *this;
    }

    /**
     * Set the signer sequence. It must exceed every sequence the signer
     * already used on the target account.
     */
    CommandBuilder& with_sequence(uint64_t seq) {
        sequence_ = seq;
        return *this;
    }

    /**
     * Set the command message; it is packed into a protobuf Any.
     */
    template<typename T>
    CommandBuilder& with_command(const T& message) {
        command_ = helpers::pack_any(message);
        return *this;
    }

    /**
     * Set an already packed command.
     */
    CommandBuilder& with_packed_command(const google::protobuf::Any& command) {
        command_ = command;
        return *this;
    }

    /**
     * Build the CommandBook.
     *
     * @throws SettlementError InvalidInput if root, signer or command is missing
     */
    CommandBook build() const {
        if (!root_.has_value()) {
            throw SettlementError::invalid_input("command root not set");
        }
        if (!signer_.has_value()) {
            throw SettlementError::invalid_input("command signer not set");
        }
        if (!command_.has_value()) {
            throw SettlementError::invalid_input("command payload not set");
        }

        CommandBook book;
        auto* cover = book.mutable_cover();
        cover->set_domain(domain_);
        cover->set_root(to_bytes(root_.value()));
        cover->set_correlation_id(correlation_id_.value_or(generate_correlation_id()));
        book.set_signer(to_bytes(signer_.value()));

        auto* page = book.add_pages();
        page->set_sequence(sequence_);
        page->mutable_command()->CopyFrom(command_.value());
        return book;
    }

private:
    std::string domain_;
    std::optional<Address> root_;
    std::optional<Identity> signer_;
    std::optional<std::string> correlation_id_;
    uint64_t sequence_ = 0;
    std::optional<google::protobuf::Any> command_;

    static std::string generate_correlation_id() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        static const char hex[] = "0123456789abcdef";
        std::string uuid(36, '-');
        for (int i = 0; i < 36; ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) continue;
            uuid[i] = hex[rng() % 16];
        }
        // Set version (4) and variant (8, 9, a, or b)
        uuid[14] = '4';
        uuid[19] = hex[(rng() % 4) + 8];
        return uuid;
    }
};

} // namespace vault
