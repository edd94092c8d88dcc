#include "vault/crypto.hpp"
#include "vault/errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace vault {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

MdCtxPtr new_md_ctx() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    return ctx;
}

PkeyPtr private_key_from_seed(const Key32& seed) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        throw std::runtime_error("invalid Ed25519 seed");
    }
    return key;
}

} // anonymous namespace

Digest sha256(const std::string& data) {
    Digest digest{};
    unsigned int length = 0;
    auto ctx = new_md_ctx();
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

bool constant_time_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool Ed25519Verifier::verify(const std::string& message,
                             const std::string& signature,
                             const Identity& expected_signer) const {
    if (signature.size() != SIGNATURE_BYTES || is_default(expected_signer)) {
        return false;
    }

    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                            expected_signer.data(), expected_signer.size()));
    if (!key) {
        return false;
    }

    auto ctx = new_md_ctx();
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size());
    return rc == 1;
}

Ed25519KeyPair Ed25519KeyPair::generate() {
    Key32 seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return from_seed(seed);
}

Ed25519KeyPair Ed25519KeyPair::from_seed(const Key32& seed) {
    auto key = private_key_from_seed(seed);
    Identity public_key{};
    size_t length = public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != 1 ||
        length != public_key.size()) {
        throw std::runtime_error("failed to derive Ed25519 public key");
    }
    return Ed25519KeyPair(seed, public_key);
}

Signature Ed25519KeyPair::sign(const std::string& message) const {
    auto key = private_key_from_seed(seed_);
    auto ctx = new_md_ctx();

    Signature signature{};
    size_t length = signature.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &length,
                       reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1 ||
        length != signature.size()) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    return signature;
}

} // namespace vault
