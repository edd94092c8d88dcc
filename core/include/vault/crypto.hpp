#pragma once

#include <memory>
#include <string>
#include "vault/keys.hpp"

namespace vault {

/// SHA-256 of a byte string.
Digest sha256(const std::string& data);

/// Constant-time comparison; false on length mismatch.
bool constant_time_equal(const std::string& a, const std::string& b);

/**
 * Verifies a detached signature against an expected signer identity.
 *
 * This is the single seam through which judge and envelope signatures are
 * checked, so tests and deployments can substitute their own scheme.
 */
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    virtual bool verify(const std::string& message,
                        const std::string& signature,
                        const Identity& expected_signer) const = 0;
};

/// Ed25519 verification via OpenSSL EVP.
class Ed25519Verifier : public SignatureVerifier {
public:
    bool verify(const std::string& message,
                const std::string& signature,
                const Identity& expected_signer) const override;
};

/**
 * Ed25519 signing key. Used by clients, tooling and tests to produce
 * envelope and decision signatures.
 */
class Ed25519KeyPair {
public:
    static Ed25519KeyPair generate();
    static Ed25519KeyPair from_seed(const Key32& seed);

    const Identity& public_key() const { return public_key_; }
    Signature sign(const std::string& message) const;

private:
    Ed25519KeyPair(const Key32& seed, const Identity& public_key)
        : seed_(seed), public_key_(public_key) {}

    Key32 seed_;
    Identity public_key_;
};

} // namespace vault
