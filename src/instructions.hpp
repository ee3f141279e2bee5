#pragma once

#include "addresses.hpp"
#include "instruction.hpp"
#include "order.hpp"
#include "verification.hpp"

#include <vector>

namespace ordermill {

// Settlement program operations. Closed, versioned set: values are fixed by the
// deployed program and must not be extended here.
enum class InstructionKind : uint8_t {
    Initialize = 0,
    CreateMarket = 1,
    AddDepositMint = 2,
    MintCompleteSet = 3,
    MergeCompleteSet = 4,
    CancelOrder = 5,
    IncrementNonce = 6,
    SettleMarket = 7,
    RedeemWinnings = 8,
    SetPaused = 9,
    SetOperator = 10,
    WithdrawFromPosition = 11,
    ActivateMarket = 12,
    MatchOrdersMulti = 13
};

// Bit 7: taker fully filled; bit i (i < makers): maker i fully filled.
// A clear bit means partial: the order's status account stays open.
constexpr uint8_t kTakerFullFillBit = 0x80;

// One taker matched against 1..5 makers
struct MatchRequest {
    PublicKey operatorKey; // Signs and pays for the transaction
    PublicKey market;
    PublicKey baseMint;
    PublicKey quoteMint;
    Order takerOrder;
    std::vector<Order> makerOrders;
    std::vector<Amount> makerFillAmounts; // Given by each maker
    std::vector<Amount> takerFillAmounts; // Received by each maker
    uint8_t fullFillBitmask;
};

// Byte layout of the MatchOrdersMulti payload:
//   [0] discriminator  [1..33) taker hash  [33..98) taker compact  [98..162) taker signature
//   [162] maker count  [163] full-fill bitmask
//   then per maker (177 bytes): hash(32) compact(65) signature(64) makerFill(8) takerFill(8)
namespace settlement_layout {

constexpr size_t kDiscriminatorAt = 0;
constexpr size_t kTakerHashAt = 1;
constexpr size_t kTakerCompactAt = kTakerHashAt + kHashSize;             // 33
constexpr size_t kTakerSignatureAt = kTakerCompactAt + kCompactOrderSize; // 98
constexpr size_t kMakerCountAt = kTakerSignatureAt + kSignatureSize;      // 162
constexpr size_t kBitmaskAt = kMakerCountAt + 1;                          // 163
constexpr size_t kMakersAt = kBitmaskAt + 1;                              // 164
constexpr size_t kMakerEntrySize = kHashSize + kCompactOrderSize + kSignatureSize + 8 + 8; // 177

// Maker public key sits after the 4-byte compact nonce
constexpr size_t kCompactMakerAt = 4;

[[nodiscard]] constexpr size_t makerEntryAt(size_t makerIndex) { return kMakersAt + makerIndex * kMakerEntrySize; }
[[nodiscard]] constexpr size_t sizeFor(size_t makerCount) { return kMakersAt + makerCount * kMakerEntrySize; }

// Where each party's (signature, public key, message) lives; taker first, then makers
[[nodiscard]] verification::CrossReference takerReference();
[[nodiscard]] verification::CrossReference makerReference(size_t makerIndex);
[[nodiscard]] std::vector<verification::CrossReference> references(size_t makerCount);

} // namespace settlement_layout

// Shape checks: 1..5 makers, parallel arrays, bitmask bits. Throws ProtocolError(Structural).
void validateMatchShape(const MatchRequest& request);

// Settlement instruction for a shape-valid request (validateMatchShape is applied)
[[nodiscard]] Instruction buildMatchOrders(const MatchRequest& request, const AddressBook& addresses);

// Cancels a signed order: data = [5] || hash || full order (258 bytes)
[[nodiscard]] Instruction buildCancelOrder(const Order& order, const PublicKey& market, const AddressBook& addresses);

// Bumps the user's on-ledger nonce, invalidating every order below it
[[nodiscard]] Instruction buildIncrementNonce(const PublicKey& user, const AddressBook& addresses);

} // namespace ordermill
