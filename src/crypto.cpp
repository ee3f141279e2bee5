#include "crypto.hpp"
#include "error.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace ordermill::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

PkeyPtr privateKeyFromSeed(const Seed& seed)
{
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        throw ProtocolError(ErrorCode::CryptoFailure, "failed to load Ed25519 private key");
    }
    return key;
}

} // namespace

std::array<uint8_t, 32> sha3_256(const uint8_t* data, size_t size)
{
    std::array<uint8_t, 32> digest{};
    unsigned int digestSize = 0;
    if (EVP_Digest(data, size, digest.data(), &digestSize, EVP_sha3_256(), nullptr) != 1 ||
        digestSize != digest.size()) {
        throw ProtocolError(ErrorCode::CryptoFailure, "SHA3-256 digest failed");
    }
    return digest;
}

Keypair::Keypair(const Seed& seed, const PublicKey& publicKey) : m_seed(seed), m_publicKey(publicKey) {}

Keypair Keypair::fromSeed(const Seed& seed)
{
    PkeyPtr key = privateKeyFromSeed(seed);

    PublicKey publicKey{};
    size_t publicKeySize = publicKey.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), publicKey.data(), &publicKeySize) != 1 ||
        publicKeySize != publicKey.size()) {
        throw ProtocolError(ErrorCode::CryptoFailure, "failed to derive Ed25519 public key");
    }
    return Keypair(seed, publicKey);
}

Keypair Keypair::generate()
{
    Seed seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw ProtocolError(ErrorCode::CryptoFailure, "random seed generation failed");
    }
    return fromSeed(seed);
}

Signature Keypair::sign(const uint8_t* message, size_t size) const
{
    PkeyPtr key = privateKeyFromSeed(m_seed);
    MdContextPtr context(EVP_MD_CTX_new());
    if (!context) {
        throw ProtocolError(ErrorCode::CryptoFailure, "failed to allocate signing context");
    }

    // Ed25519 is a one-shot scheme: no digest is configured
    if (EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        throw ProtocolError(ErrorCode::CryptoFailure, "Ed25519 sign init failed");
    }

    Signature signature{};
    size_t signatureSize = signature.size();
    if (EVP_DigestSign(context.get(), signature.data(), &signatureSize, message, size) != 1 ||
        signatureSize != signature.size()) {
        throw ProtocolError(ErrorCode::CryptoFailure, "Ed25519 signing failed");
    }
    return signature;
}

bool ed25519Verify(const uint8_t* publicKey, size_t publicKeySize, const uint8_t* message, size_t messageSize,
                   const uint8_t* signature, size_t signatureSize)
{
    if (publicKeySize != kPublicKeySize || messageSize != kHashSize || signatureSize != kSignatureSize) {
        return false;
    }
    if (publicKey == nullptr || message == nullptr || signature == nullptr) {
        return false;
    }

    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey, publicKeySize));
    if (!key) {
        return false;
    }

    MdContextPtr context(EVP_MD_CTX_new());
    if (!context) {
        return false;
    }
    if (EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(context.get(), signature, signatureSize, message, messageSize) == 1;
}

} // namespace ordermill::crypto
