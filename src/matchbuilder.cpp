#include "matchbuilder.hpp"
#include "crossing.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "ordercodec.hpp"
#include "signing.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace ordermill {

namespace {

void requireSameMarket(const MatchRequest& request, const Order& order, const char* role)
{
    if (order.market != request.market || order.baseMint != request.baseMint ||
        order.quoteMint != request.quoteMint) {
        throw ProtocolError(ErrorCode::MarketMismatch, std::string(role) + " order " + std::to_string(order.nonce) +
                                                           " from " + encoding::toBase58(order.maker) +
                                                           " does not reference the match market and mints");
    }
}

} // namespace

MatchTransactionBuilder::MatchTransactionBuilder(const ProgramConfig& config, AddressDeriver deriver,
                                                 VerificationMode mode)
    : m_addresses(config, std::move(deriver)), m_mode(mode)
{
}

void MatchTransactionBuilder::validate(const MatchRequest& request, Timestamp now) const
{
    validateMatchShape(request);

    // Each order may appear once: per-entry fill limits say nothing about repeats
    std::vector<OrderHash> seen{codec::hash(request.takerOrder)};
    for (size_t i = 0; i < request.makerOrders.size(); ++i) {
        OrderHash makerHash = codec::hash(request.makerOrders[i]);
        if (std::find(seen.begin(), seen.end(), makerHash) != seen.end()) {
            throw ProtocolError(ErrorCode::DuplicateOrder, "maker " + std::to_string(i) + " repeats order " +
                                                               encoding::toHex(makerHash) +
                                                               " already in this match");
        }
        seen.push_back(makerHash);
    }

    const Order& taker = request.takerOrder;
    requireSameMarket(request, taker, "taker");
    signing::requireValid(taker, now);
    for (const auto& maker : request.makerOrders) {
        requireSameMarket(request, maker, "maker");
        signing::requireValid(maker, now);
    }

    Amount takerGives = 0;
    for (size_t i = 0; i < request.makerOrders.size(); ++i) {
        const Order& maker = request.makerOrders[i];
        crossing::requireCross(taker, maker);

        const Amount makerFill = request.makerFillAmounts[i];
        if (makerFill == 0) {
            throw ProtocolError(ErrorCode::ZeroAmount, "maker " + std::to_string(i) + " has a zero fill");
        }

        const Amount expected = crossing::takerFillFor(maker, makerFill);
        if (request.takerFillAmounts[i] != expected) {
            throw ProtocolError(ErrorCode::InconsistentFill, "maker " + std::to_string(i) + ": taker fill " +
                                                                 std::to_string(request.takerFillAmounts[i]) +
                                                                 " does not match " + std::to_string(expected) +
                                                                 " implied by maker fill " +
                                                                 std::to_string(makerFill));
        }

        if (expected > std::numeric_limits<Amount>::max() - takerGives) {
            throw ProtocolError(ErrorCode::Overflow, "sum of taker fills overflows");
        }
        takerGives += expected;
    }

    // Taker fills are what the taker hands over across all makers
    if (takerGives > taker.makerAmount) {
        throw ProtocolError(ErrorCode::FillExceedsAmount, "taker fills total " + std::to_string(takerGives) +
                                                              " exceeds taker order amount " +
                                                              std::to_string(taker.makerAmount));
    }
}

Transaction MatchTransactionBuilder::build(const MatchRequest& request, Timestamp now) const
{
    validate(request, now);

    Transaction transaction{};
    transaction.feePayer = request.operatorKey;
    transaction.instructions = verificationInstructions(request);
    transaction.instructions.push_back(buildMatchOrders(request, m_addresses));
    return transaction;
}

std::vector<Instruction> MatchTransactionBuilder::verificationInstructions(const MatchRequest& request) const
{
    const PublicKey& verifier = m_addresses.config().verifierProgram;
    const size_t makerCount = request.makerOrders.size();

    std::vector<verification::VerifyParams> params;
    params.reserve(makerCount + 1);
    params.push_back(verification::VerifyParams::fromOrder(request.takerOrder));
    for (const auto& maker : request.makerOrders) {
        params.push_back(verification::VerifyParams::fromOrder(maker));
    }

    switch (m_mode) {
    case VerificationMode::Batch:
        return {verification::batch(verifier, params)};
    case VerificationMode::CrossReferenced:
        // Settlement follows the makerCount + 1 verifier instructions
        return verification::crossReferenced(verifier, settlement_layout::references(makerCount),
                                             static_cast<uint16_t>(makerCount + 1));
    case VerificationMode::Individual:
        break;
    }

    std::vector<Instruction> instructions;
    instructions.reserve(params.size());
    for (const auto& entry : params) {
        instructions.push_back(verification::single(verifier, entry));
    }
    return instructions;
}

} // namespace ordermill
