#pragma once

#include "types.hpp"

#include <algorithm>
#include <optional>

namespace ordermill {

// Economic terms shared by bid and ask construction
struct OrderParams {
    Nonce nonce;           // Must be >= the maker's on-ledger nonce
    PublicKey maker;       // Order creator
    PublicKey market;      // Market identity
    PublicKey baseMint;    // Token being bought or sold
    PublicKey quoteMint;   // Token used for payment
    Amount makerAmount;    // Amount the maker gives
    Amount takerAmount;    // Amount the maker wants
    Timestamp expiration;  // 0 = never expires
};

struct Order {
    Nonce nonce;
    PublicKey maker;
    PublicKey market;
    PublicKey baseMint;
    PublicKey quoteMint;
    Side side;
    Amount makerAmount;
    Amount takerAmount;
    Timestamp expiration;
    std::optional<Signature> signature; // nullopt = unsigned (all-zero on the wire)

    // All-zero signature bytes count as unsigned
    [[nodiscard]] bool isSigned() const
    {
        return signature.has_value() &&
               std::any_of(signature->begin(), signature->end(), [](uint8_t b) { return b != 0; });
    }

    // Signature bytes as they go on the wire (all-zero when unsigned)
    [[nodiscard]] Signature wireSignature() const { return signature.value_or(Signature{}); }

    // Unsigned and all-zero signatures encode identically, so they compare equal
    bool operator==(const Order& other) const
    {
        return nonce == other.nonce && maker == other.maker && market == other.market &&
               baseMint == other.baseMint && quoteMint == other.quoteMint && side == other.side &&
               makerAmount == other.makerAmount && takerAmount == other.takerAmount &&
               expiration == other.expiration && wireSignature() == other.wireSignature();
    }
    bool operator!=(const Order& other) const { return !(*this == other); }
};

// Maker-identifying projection; market and mints are implied by the enclosing transaction.
// Holds only the low 32 bits of the nonce.
struct CompactOrder {
    uint32_t nonceLow;
    PublicKey maker;
    Side side;
    Amount makerAmount;
    Amount takerAmount;
    Timestamp expiration;

    bool operator==(const CompactOrder& other) const
    {
        return nonceLow == other.nonceLow && maker == other.maker && side == other.side &&
               makerAmount == other.makerAmount && takerAmount == other.takerAmount &&
               expiration == other.expiration;
    }
    bool operator!=(const CompactOrder& other) const { return !(*this == other); }
};

// Unsigned bid: maker gives quote, receives base
[[nodiscard]] inline Order makeBid(const OrderParams& params)
{
    return Order{params.nonce,       params.maker,       params.market,     params.baseMint,
                 params.quoteMint,   Side::Bid,          params.makerAmount, params.takerAmount,
                 params.expiration, std::nullopt};
}

// Unsigned ask: maker gives base, receives quote
[[nodiscard]] inline Order makeAsk(const OrderParams& params)
{
    return Order{params.nonce,       params.maker,       params.market,     params.baseMint,
                 params.quoteMint,   Side::Ask,          params.makerAmount, params.takerAmount,
                 params.expiration, std::nullopt};
}

} // namespace ordermill
