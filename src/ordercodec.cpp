#include "ordercodec.hpp"
#include "crypto.hpp"
#include "encoding.hpp"
#include "error.hpp"

#include <algorithm>
#include <cstring>

namespace ordermill::codec {

using encoding::getLe;
using encoding::putLe;

namespace {

// Full-layout offsets
constexpr size_t kNonceAt = 0;
constexpr size_t kMakerAt = 8;
constexpr size_t kMarketAt = 40;
constexpr size_t kBaseMintAt = 72;
constexpr size_t kQuoteMintAt = 104;
constexpr size_t kSideAt = 136;
constexpr size_t kMakerAmountAt = 137;
constexpr size_t kTakerAmountAt = 145;
constexpr size_t kExpirationAt = 153;
constexpr size_t kSignatureAt = 161;

// Compact-layout offsets
constexpr size_t kCompactNonceAt = 0;
constexpr size_t kCompactMakerAt = 4;
constexpr size_t kCompactSideAt = 36;
constexpr size_t kCompactMakerAmountAt = 37;
constexpr size_t kCompactTakerAmountAt = 45;
constexpr size_t kCompactExpirationAt = 53;
constexpr size_t kCompactPadAt = 61;

template <size_t N> void putArray(uint8_t* out, const std::array<uint8_t, N>& value)
{
    std::memcpy(out, value.data(), N);
}

template <size_t N> std::array<uint8_t, N> getArray(const uint8_t* in)
{
    std::array<uint8_t, N> value{};
    std::memcpy(value.data(), in, N);
    return value;
}

void requireExactSize(size_t actual, size_t expected, const char* what)
{
    if (actual != expected) {
        throw ProtocolError(ErrorCode::InvalidLength, std::string(what) + ": expected " + std::to_string(expected) +
                                                          " bytes, got " + std::to_string(actual));
    }
}

} // namespace

Side sideFromByte(uint8_t value)
{
    if (value == static_cast<uint8_t>(Side::Bid))
        return Side::Bid;
    if (value == static_cast<uint8_t>(Side::Ask))
        return Side::Ask;
    throw ProtocolError(ErrorCode::InvalidSide, "invalid side value " + std::to_string(value) + " (must be 0 or 1)");
}

FullOrderBytes encodeFull(const Order& order)
{
    FullOrderBytes data{};
    putLe<uint64_t>(data.data() + kNonceAt, order.nonce);
    putArray(data.data() + kMakerAt, order.maker);
    putArray(data.data() + kMarketAt, order.market);
    putArray(data.data() + kBaseMintAt, order.baseMint);
    putArray(data.data() + kQuoteMintAt, order.quoteMint);
    data[kSideAt] = static_cast<uint8_t>(order.side);
    putLe<uint64_t>(data.data() + kMakerAmountAt, order.makerAmount);
    putLe<uint64_t>(data.data() + kTakerAmountAt, order.takerAmount);
    putLe<uint64_t>(data.data() + kExpirationAt, order.expiration);
    if (order.signature.has_value()) {
        putArray(data.data() + kSignatureAt, *order.signature);
    }
    return data;
}

Order decodeFull(const uint8_t* data, size_t size)
{
    requireExactSize(size, kFullOrderSize, "full order");

    Order order{};
    order.nonce = getLe<uint64_t>(data + kNonceAt);
    order.maker = getArray<kPublicKeySize>(data + kMakerAt);
    order.market = getArray<kPublicKeySize>(data + kMarketAt);
    order.baseMint = getArray<kPublicKeySize>(data + kBaseMintAt);
    order.quoteMint = getArray<kPublicKeySize>(data + kQuoteMintAt);
    order.side = sideFromByte(data[kSideAt]);
    order.makerAmount = getLe<uint64_t>(data + kMakerAmountAt);
    order.takerAmount = getLe<uint64_t>(data + kTakerAmountAt);
    order.expiration = getLe<uint64_t>(data + kExpirationAt);

    auto signature = getArray<kSignatureSize>(data + kSignatureAt);
    bool allZero = std::all_of(signature.begin(), signature.end(), [](uint8_t b) { return b == 0; });
    if (!allZero) {
        order.signature = signature;
    }
    return order;
}

CompactOrderBytes encodeCompact(const CompactOrder& order)
{
    CompactOrderBytes data{};
    putLe<uint32_t>(data.data() + kCompactNonceAt, order.nonceLow);
    putArray(data.data() + kCompactMakerAt, order.maker);
    data[kCompactSideAt] = static_cast<uint8_t>(order.side);
    putLe<uint64_t>(data.data() + kCompactMakerAmountAt, order.makerAmount);
    putLe<uint64_t>(data.data() + kCompactTakerAmountAt, order.takerAmount);
    putLe<uint64_t>(data.data() + kCompactExpirationAt, order.expiration);
    return data;
}

CompactOrder decodeCompact(const uint8_t* data, size_t size)
{
    requireExactSize(size, kCompactOrderSize, "compact order");

    for (size_t i = kCompactPadAt; i < kCompactOrderSize; ++i) {
        if (data[i] != 0) {
            throw ProtocolError(ErrorCode::InvalidPadding,
                                "compact order pad byte " + std::to_string(i) + " is not zero");
        }
    }

    CompactOrder order{};
    order.nonceLow = getLe<uint32_t>(data + kCompactNonceAt);
    order.maker = getArray<kPublicKeySize>(data + kCompactMakerAt);
    order.side = sideFromByte(data[kCompactSideAt]);
    order.makerAmount = getLe<uint64_t>(data + kCompactMakerAmountAt);
    order.takerAmount = getLe<uint64_t>(data + kCompactTakerAmountAt);
    order.expiration = getLe<uint64_t>(data + kCompactExpirationAt);
    return order;
}

CompactOrder toCompact(const Order& order)
{
    return CompactOrder{static_cast<uint32_t>(order.nonce & 0xFFFFFFFFu), order.maker, order.side,
                        order.makerAmount, order.takerAmount, order.expiration};
}

Order expandCompact(const CompactOrder& compact, Nonce fullNonce, const PublicKey& market, const PublicKey& baseMint,
                    const PublicKey& quoteMint, const std::optional<Signature>& signature)
{
    if (static_cast<uint32_t>(fullNonce & 0xFFFFFFFFu) != compact.nonceLow) {
        throw ProtocolError(ErrorCode::NonceMismatch, "nonce " + std::to_string(fullNonce) +
                                                          " does not match compact nonce " +
                                                          std::to_string(compact.nonceLow));
    }

    return Order{fullNonce,          compact.maker,       market,
                 baseMint,           quoteMint,           compact.side,
                 compact.makerAmount, compact.takerAmount, compact.expiration,
                 signature};
}

OrderHash hash(const Order& order)
{
    FullOrderBytes encoded = encodeFull(order);

    Bytes message;
    message.reserve(kOrderHashDomainSize + kHashedOrderSize);
    message.insert(message.end(), kOrderHashDomain, kOrderHashDomain + kOrderHashDomainSize);
    message.insert(message.end(), encoded.begin(), encoded.begin() + kHashedOrderSize);

    return crypto::sha3_256(message);
}

std::string orderbookId(const Order& order)
{
    std::string base = encoding::toBase58(order.baseMint);
    std::string quote = encoding::toBase58(order.quoteMint);
    return base.substr(0, 8) + "_" + quote.substr(0, 8);
}

} // namespace ordermill::codec
