#include "instructions.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "ordercodec.hpp"

#include <string>
#include <utility>

namespace ordermill {

using encoding::appendLe;

namespace settlement_layout {

verification::CrossReference takerReference()
{
    return {static_cast<uint16_t>(kTakerSignatureAt), static_cast<uint16_t>(kTakerCompactAt + kCompactMakerAt),
            static_cast<uint16_t>(kTakerHashAt), static_cast<uint16_t>(kHashSize)};
}

verification::CrossReference makerReference(size_t makerIndex)
{
    const size_t entry = makerEntryAt(makerIndex);
    const size_t hashAt = entry;
    const size_t compactAt = hashAt + kHashSize;
    const size_t signatureAt = compactAt + kCompactOrderSize;
    return {static_cast<uint16_t>(signatureAt), static_cast<uint16_t>(compactAt + kCompactMakerAt),
            static_cast<uint16_t>(hashAt), static_cast<uint16_t>(kHashSize)};
}

std::vector<verification::CrossReference> references(size_t makerCount)
{
    std::vector<verification::CrossReference> result;
    result.reserve(makerCount + 1);
    result.push_back(takerReference());
    for (size_t i = 0; i < makerCount; ++i) {
        result.push_back(makerReference(i));
    }
    return result;
}

} // namespace settlement_layout

namespace {

template <size_t N> void appendArray(Bytes& out, const std::array<uint8_t, N>& value)
{
    out.insert(out.end(), value.begin(), value.end());
}

bool bitSet(uint8_t mask, unsigned bit) { return ((mask >> bit) & 1u) != 0; }

} // namespace

void validateMatchShape(const MatchRequest& request)
{
    const size_t makerCount = request.makerOrders.size();
    if (makerCount == 0) {
        throw ProtocolError(ErrorCode::NoMakers, "match needs at least one maker order");
    }
    if (makerCount > kMaxMakers) {
        throw ProtocolError(ErrorCode::TooManyMakers, "too many makers: " + std::to_string(makerCount) + " (max " +
                                                          std::to_string(kMaxMakers) + ")");
    }
    if (request.makerFillAmounts.size() != makerCount) {
        throw ProtocolError(ErrorCode::LengthMismatch, "maker fill amounts: expected " + std::to_string(makerCount) +
                                                           ", got " + std::to_string(request.makerFillAmounts.size()));
    }
    if (request.takerFillAmounts.size() != makerCount) {
        throw ProtocolError(ErrorCode::LengthMismatch, "taker fill amounts: expected " + std::to_string(makerCount) +
                                                           ", got " + std::to_string(request.takerFillAmounts.size()));
    }

    const uint8_t allowed = static_cast<uint8_t>(kTakerFullFillBit | ((1u << makerCount) - 1u));
    const uint8_t stray = static_cast<uint8_t>(request.fullFillBitmask & ~allowed);
    if (stray != 0) {
        throw ProtocolError(ErrorCode::InvalidBitmask, "full-fill bitmask 0x" +
                                                           encoding::toHex(&request.fullFillBitmask, 1) +
                                                           " sets bits outside makers 0.." +
                                                           std::to_string(makerCount - 1) + " and taker bit 7");
    }
}

Instruction buildMatchOrders(const MatchRequest& request, const AddressBook& addresses)
{
    validateMatchShape(request);

    const ProgramConfig& config = addresses.config();
    const Order& taker = request.takerOrder;
    const OrderHash takerHash = codec::hash(taker);
    const PublicKey takerPosition = addresses.position(taker.maker, request.market);

    std::vector<AccountMeta> accounts;
    accounts.push_back(signerWritable(request.operatorKey));
    accounts.push_back(readonly(addresses.exchange()));
    accounts.push_back(readonly(request.market));
    if (!bitSet(request.fullFillBitmask, 7)) {
        accounts.push_back(writable(addresses.orderStatus(takerHash)));
    }
    accounts.push_back(readonly(addresses.userNonce(taker.maker)));
    accounts.push_back(writable(takerPosition));
    accounts.push_back(readonly(request.baseMint));
    accounts.push_back(readonly(request.quoteMint));
    accounts.push_back(writable(addresses.tokenAccount(takerPosition, request.baseMint)));
    accounts.push_back(writable(addresses.tokenAccount(takerPosition, request.quoteMint)));
    accounts.push_back(readonly(config.tokenProgram));
    accounts.push_back(readonly(config.systemProgram));
    accounts.push_back(readonly(config.instructionsSysvar));

    std::vector<OrderHash> makerHashes;
    makerHashes.reserve(request.makerOrders.size());
    for (size_t i = 0; i < request.makerOrders.size(); ++i) {
        const Order& maker = request.makerOrders[i];
        makerHashes.push_back(codec::hash(maker));
        const PublicKey makerPosition = addresses.position(maker.maker, request.market);

        if (!bitSet(request.fullFillBitmask, static_cast<unsigned>(i))) {
            accounts.push_back(writable(addresses.orderStatus(makerHashes.back())));
        }
        accounts.push_back(readonly(addresses.userNonce(maker.maker)));
        accounts.push_back(writable(makerPosition));
        accounts.push_back(writable(addresses.tokenAccount(makerPosition, request.baseMint)));
        accounts.push_back(writable(addresses.tokenAccount(makerPosition, request.quoteMint)));
    }

    Bytes data;
    data.reserve(settlement_layout::sizeFor(request.makerOrders.size()));
    data.push_back(static_cast<uint8_t>(InstructionKind::MatchOrdersMulti));
    appendArray(data, takerHash);
    appendArray(data, codec::encodeCompact(codec::toCompact(taker)));
    appendArray(data, taker.wireSignature());
    data.push_back(static_cast<uint8_t>(request.makerOrders.size()));
    data.push_back(request.fullFillBitmask);

    for (size_t i = 0; i < request.makerOrders.size(); ++i) {
        const Order& maker = request.makerOrders[i];
        appendArray(data, makerHashes[i]);
        appendArray(data, codec::encodeCompact(codec::toCompact(maker)));
        appendArray(data, maker.wireSignature());
        appendLe<uint64_t>(data, request.makerFillAmounts[i]);
        appendLe<uint64_t>(data, request.takerFillAmounts[i]);
    }

    return Instruction{config.settlementProgram, std::move(accounts), std::move(data)};
}

Instruction buildCancelOrder(const Order& order, const PublicKey& market, const AddressBook& addresses)
{
    if (!order.isSigned()) {
        throw ProtocolError(ErrorCode::Unsigned, "cannot cancel unsigned order " + std::to_string(order.nonce));
    }

    const OrderHash orderHash = codec::hash(order);
    const ProgramConfig& config = addresses.config();

    std::vector<AccountMeta> accounts{signerWritable(order.maker), readonly(market),
                                      writable(addresses.orderStatus(orderHash)), readonly(config.systemProgram)};

    Bytes data;
    data.reserve(1 + kHashSize + kFullOrderSize);
    data.push_back(static_cast<uint8_t>(InstructionKind::CancelOrder));
    appendArray(data, orderHash);
    appendArray(data, codec::encodeFull(order));

    return Instruction{config.settlementProgram, std::move(accounts), std::move(data)};
}

Instruction buildIncrementNonce(const PublicKey& user, const AddressBook& addresses)
{
    const ProgramConfig& config = addresses.config();
    std::vector<AccountMeta> accounts{signerWritable(user), writable(addresses.userNonce(user)),
                                      readonly(config.systemProgram)};
    return Instruction{config.settlementProgram, std::move(accounts),
                       Bytes{static_cast<uint8_t>(InstructionKind::IncrementNonce)}};
}

} // namespace ordermill
