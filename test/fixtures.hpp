#pragma once

#include "../src/addresses.hpp"
#include "../src/crypto.hpp"
#include "../src/order.hpp"

#include <vector>

namespace fixtures {

using namespace ordermill;

// Fixed instant used wherever "now" matters
constexpr Timestamp kNow = 1700000000;

template <size_t N> std::array<uint8_t, N> filled(uint8_t value)
{
    std::array<uint8_t, N> result{};
    result.fill(value);
    return result;
}

inline PublicKey key(uint8_t value) { return filled<kPublicKeySize>(value); }
inline Seed seed(uint8_t value) { return filled<kSeedSize>(value); }

const PublicKey kMarket = key(0xA1);
const PublicKey kBaseMint = key(0xB1);
const PublicKey kQuoteMint = key(0xC1);
const PublicKey kOperator = key(0x0E);

// Stand-in for ledger address derivation: SHA3 over the seeds and program id
inline DerivedAddress testDeriver(const std::vector<Bytes>& seeds, const PublicKey& programId)
{
    Bytes preimage;
    for (const auto& part : seeds) {
        preimage.insert(preimage.end(), part.begin(), part.end());
    }
    preimage.insert(preimage.end(), programId.begin(), programId.end());
    return DerivedAddress{crypto::sha3_256(preimage), 255};
}

inline OrderParams params(const PublicKey& maker, Nonce nonce, Amount makerAmount, Amount takerAmount,
                          Timestamp expiration = 0)
{
    return OrderParams{nonce, maker, kMarket, kBaseMint, kQuoteMint, makerAmount, takerAmount, expiration};
}

} // namespace fixtures
