#pragma once

#include "instruction.hpp"
#include "order.hpp"

#include <vector>

namespace ordermill::verification {

// Native Ed25519 verifier payload:
//   u8 count, u8 pad, then per signature 7 x u16 (LE):
//     signatureOffset, signatureIx, publicKeyOffset, publicKeyIx, messageOffset, messageSize, messageIx
//   followed, in inline mode, by signature(64) || publicKey(32) || message(32) per triple.
constexpr size_t kHeaderBaseSize = 2;
constexpr size_t kOffsetsSize = 14;
constexpr size_t kTripleSize = kSignatureSize + kPublicKeySize + kHashSize; // 128
constexpr uint16_t kThisInstruction = 0xFFFF;
constexpr size_t kMaxSignatures = 255;

[[nodiscard]] constexpr size_t headerSize(size_t count) { return kHeaderBaseSize + count * kOffsetsSize; }
[[nodiscard]] constexpr size_t inlineSize(size_t count) { return headerSize(count) + count * kTripleSize; }

struct VerifyParams {
    PublicKey publicKey;
    OrderHash message; // 32-byte order hash
    Signature signature;

    // Order must carry a signature (ProtocolError Unsigned otherwise)
    [[nodiscard]] static VerifyParams fromOrder(const Order& order);

    // Length-checked construction from untyped buffers (ProtocolError InvalidLength)
    [[nodiscard]] static VerifyParams fromBytes(const Bytes& publicKey, const Bytes& message, const Bytes& signature);
};

// Where, inside another instruction of the same transaction, a triple lives
struct CrossReference {
    uint16_t signatureOffset;
    uint16_t publicKeyOffset;
    uint16_t messageOffset;
    uint16_t messageSize;
};

// One inline signature: 144-byte payload, no accounts
[[nodiscard]] Instruction single(const PublicKey& verifierProgram, const VerifyParams& params);
[[nodiscard]] Instruction single(const PublicKey& verifierProgram, const Bytes& publicKey, const Bytes& message,
                                 const Bytes& signature);

// One instruction, n inline signatures: 2 + 14n + 128n bytes. Empty or > 255 entries is an error.
[[nodiscard]] Instruction batch(const PublicKey& verifierProgram, const std::vector<VerifyParams>& params);

// One 16-byte header-only instruction per reference, all pointing into the
// instruction at targetInstructionIndex (which must execute in the same transaction)
[[nodiscard]] std::vector<Instruction> crossReferenced(const PublicKey& verifierProgram,
                                                      const std::vector<CrossReference>& references,
                                                      uint16_t targetInstructionIndex);

} // namespace ordermill::verification
