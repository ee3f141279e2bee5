#include "crossing.hpp"
#include "error.hpp"

#include <string>

namespace ordermill::crossing {

using Wide = unsigned __int128;

bool canCross(const Order& bid, const Order& ask)
{
    if (bid.side != Side::Bid || ask.side != Side::Ask) {
        return false;
    }
    if (bid.makerAmount == 0 || bid.takerAmount == 0 || ask.makerAmount == 0 || ask.takerAmount == 0) {
        return false;
    }
    if (bid.market != ask.market || bid.baseMint != ask.baseMint || bid.quoteMint != ask.quoteMint) {
        return false;
    }

    // bid.maker/bid.taker >= ask.taker/ask.maker, cross-multiplied
    Wide bidSide = static_cast<Wide>(bid.makerAmount) * ask.makerAmount;
    Wide askSide = static_cast<Wide>(bid.takerAmount) * ask.takerAmount;
    return bidSide >= askSide;
}

Amount takerFillFor(const Order& makerOrder, Amount makerFill)
{
    if (makerOrder.makerAmount == 0) {
        throw ProtocolError(ErrorCode::ZeroAmount, "maker order " + std::to_string(makerOrder.nonce) +
                                                       " has zero maker amount");
    }
    if (makerFill > makerOrder.makerAmount) {
        throw ProtocolError(ErrorCode::FillExceedsAmount, "maker fill " + std::to_string(makerFill) +
                                                              " exceeds maker amount " +
                                                              std::to_string(makerOrder.makerAmount));
    }

    // makerFill <= makerAmount keeps the quotient <= takerAmount
    Wide result = static_cast<Wide>(makerFill) * makerOrder.takerAmount / makerOrder.makerAmount;
    return static_cast<Amount>(result);
}

void requireCross(const Order& taker, const Order& maker)
{
    if (taker.side == maker.side) {
        throw ProtocolError(ErrorCode::SameSide, "taker order " + std::to_string(taker.nonce) +
                                                     " and maker order " + std::to_string(maker.nonce) +
                                                     " are on the same side");
    }

    const Order& bid = taker.side == Side::Bid ? taker : maker;
    const Order& ask = taker.side == Side::Bid ? maker : taker;
    if (!canCross(bid, ask)) {
        throw ProtocolError(ErrorCode::OrdersDoNotCross, "bid " + std::to_string(bid.nonce) + " (" +
                                                             std::to_string(bid.makerAmount) + "/" +
                                                             std::to_string(bid.takerAmount) + ") does not cross ask " +
                                                             std::to_string(ask.nonce) + " (" +
                                                             std::to_string(ask.takerAmount) + "/" +
                                                             std::to_string(ask.makerAmount) + ")");
    }
}

} // namespace ordermill::crossing
