#pragma once

#include "types.hpp"

namespace ordermill::crypto {

// SHA3-256 (FIPS 202 Keccak) over a contiguous buffer
[[nodiscard]] std::array<uint8_t, 32> sha3_256(const uint8_t* data, size_t size);

[[nodiscard]] inline std::array<uint8_t, 32> sha3_256(const Bytes& data) { return sha3_256(data.data(), data.size()); }

// Ed25519 key pair held as its 32-byte seed
class Keypair {
public:
    // Deterministic key from a private seed
    static Keypair fromSeed(const Seed& seed);

    // Fresh key from the OpenSSL CSPRNG
    static Keypair generate();

    [[nodiscard]] const PublicKey& publicKey() const { return m_publicKey; }
    [[nodiscard]] const Seed& seed() const { return m_seed; }

    // Ed25519 signature over an arbitrary message
    [[nodiscard]] Signature sign(const uint8_t* message, size_t size) const;

    template <size_t N> [[nodiscard]] Signature sign(const std::array<uint8_t, N>& message) const
    {
        return sign(message.data(), message.size());
    }

private:
    Keypair(const Seed& seed, const PublicKey& publicKey);

    Seed m_seed;
    PublicKey m_publicKey;
};

// Standard Ed25519 verification of a 32-byte message (an order hash).
// Fails closed: wrong lengths or any library failure yield false.
[[nodiscard]] bool ed25519Verify(const uint8_t* publicKey, size_t publicKeySize, const uint8_t* message,
                                 size_t messageSize, const uint8_t* signature, size_t signatureSize);

[[nodiscard]] inline bool ed25519Verify(const PublicKey& publicKey, const OrderHash& message,
                                        const Signature& signature)
{
    return ed25519Verify(publicKey.data(), publicKey.size(), message.data(), message.size(), signature.data(),
                         signature.size());
}

} // namespace ordermill::crypto
