#pragma once

#include "order.hpp"

namespace ordermill::crossing {

// True if the bid's price (quote per base) is at least the ask's.
// Requires sides Bid/Ask, non-zero amounts and the same market and mint pair.
// Equal prices cross. Expiration is the caller's concern.
[[nodiscard]] bool canCross(const Order& bid, const Order& ask);

// floor(makerFill * takerAmount / makerAmount); never rounds in the taker's favour.
// Throws ProtocolError(Economic) if makerAmount == 0 or makerFill > makerAmount.
[[nodiscard]] Amount takerFillFor(const Order& makerOrder, Amount makerFill);

// Orients the pair by side and throws ProtocolError if it cannot cross
void requireCross(const Order& taker, const Order& maker);

} // namespace ordermill::crossing
