#include "verification.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "ordercodec.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace ordermill::verification {

using encoding::putLe;

namespace {

struct Offsets {
    uint16_t signatureOffset;
    uint16_t signatureIx;
    uint16_t publicKeyOffset;
    uint16_t publicKeyIx;
    uint16_t messageOffset;
    uint16_t messageSize;
    uint16_t messageIx;
};

void writeOffsets(uint8_t* out, const Offsets& offsets)
{
    putLe<uint16_t>(out + 0, offsets.signatureOffset);
    putLe<uint16_t>(out + 2, offsets.signatureIx);
    putLe<uint16_t>(out + 4, offsets.publicKeyOffset);
    putLe<uint16_t>(out + 6, offsets.publicKeyIx);
    putLe<uint16_t>(out + 8, offsets.messageOffset);
    putLe<uint16_t>(out + 10, offsets.messageSize);
    putLe<uint16_t>(out + 12, offsets.messageIx);
}

Instruction verifierInstruction(const PublicKey& verifierProgram, Bytes data)
{
    return Instruction{verifierProgram, {}, std::move(data)};
}

} // namespace

VerifyParams VerifyParams::fromOrder(const Order& order)
{
    if (!order.isSigned()) {
        throw ProtocolError(ErrorCode::Unsigned, "cannot verify unsigned order " + std::to_string(order.nonce));
    }
    return VerifyParams{order.maker, codec::hash(order), *order.signature};
}

VerifyParams VerifyParams::fromBytes(const Bytes& publicKey, const Bytes& message, const Bytes& signature)
{
    encoding::requireSize(publicKey, kPublicKeySize, "public key");
    encoding::requireSize(message, kHashSize, "message");
    encoding::requireSize(signature, kSignatureSize, "signature");

    VerifyParams params{};
    std::copy(publicKey.begin(), publicKey.end(), params.publicKey.begin());
    std::copy(message.begin(), message.end(), params.message.begin());
    std::copy(signature.begin(), signature.end(), params.signature.begin());
    return params;
}

Instruction single(const PublicKey& verifierProgram, const VerifyParams& params)
{
    return batch(verifierProgram, {params});
}

Instruction single(const PublicKey& verifierProgram, const Bytes& publicKey, const Bytes& message,
                   const Bytes& signature)
{
    return single(verifierProgram, VerifyParams::fromBytes(publicKey, message, signature));
}

Instruction batch(const PublicKey& verifierProgram, const std::vector<VerifyParams>& params)
{
    if (params.empty()) {
        throw ProtocolError(ErrorCode::EmptyBatch, "verification batch needs at least one signature");
    }
    if (params.size() > kMaxSignatures) {
        throw ProtocolError(ErrorCode::BatchTooLarge, "verification batch of " + std::to_string(params.size()) +
                                                          " exceeds " + std::to_string(kMaxSignatures));
    }

    const size_t count = params.size();
    const size_t dataStart = headerSize(count);
    Bytes data(inlineSize(count), 0);

    data[0] = static_cast<uint8_t>(count);
    data[1] = 0;

    for (size_t i = 0; i < count; ++i) {
        const size_t tripleStart = dataStart + i * kTripleSize;
        const size_t signatureAt = tripleStart;
        const size_t publicKeyAt = signatureAt + kSignatureSize;
        const size_t messageAt = publicKeyAt + kPublicKeySize;

        Offsets offsets{static_cast<uint16_t>(signatureAt), kThisInstruction,
                        static_cast<uint16_t>(publicKeyAt), kThisInstruction,
                        static_cast<uint16_t>(messageAt),   static_cast<uint16_t>(kHashSize),
                        kThisInstruction};
        writeOffsets(data.data() + kHeaderBaseSize + i * kOffsetsSize, offsets);

        std::copy(params[i].signature.begin(), params[i].signature.end(), data.begin() + signatureAt);
        std::copy(params[i].publicKey.begin(), params[i].publicKey.end(), data.begin() + publicKeyAt);
        std::copy(params[i].message.begin(), params[i].message.end(), data.begin() + messageAt);
    }

    return verifierInstruction(verifierProgram, std::move(data));
}

std::vector<Instruction> crossReferenced(const PublicKey& verifierProgram,
                                         const std::vector<CrossReference>& references,
                                         uint16_t targetInstructionIndex)
{
    if (references.empty()) {
        throw ProtocolError(ErrorCode::EmptyBatch, "cross-referenced verification needs at least one reference");
    }
    if (targetInstructionIndex == kThisInstruction) {
        throw ProtocolError(ErrorCode::InvalidTarget, "cross-reference target 0xFFFF denotes the verifier itself");
    }
    for (const auto& reference : references) {
        if (reference.messageSize != kHashSize) {
            throw ProtocolError(ErrorCode::InvalidLength, "cross-referenced message must be " +
                                                              std::to_string(kHashSize) + " bytes, got " +
                                                              std::to_string(reference.messageSize));
        }
    }

    std::vector<Instruction> instructions;
    instructions.reserve(references.size());
    for (const auto& reference : references) {
        Bytes data(headerSize(1), 0);
        data[0] = 1;
        data[1] = 0;

        Offsets offsets{reference.signatureOffset, targetInstructionIndex, reference.publicKeyOffset,
                        targetInstructionIndex,    reference.messageOffset, reference.messageSize,
                        targetInstructionIndex};
        writeOffsets(data.data() + kHeaderBaseSize, offsets);

        instructions.push_back(verifierInstruction(verifierProgram, std::move(data)));
    }
    return instructions;
}

} // namespace ordermill::verification
