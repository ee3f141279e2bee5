#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ordermill {

// Raw byte identities (never a human-readable form on the wire)
using Bytes = std::vector<uint8_t>;
using PublicKey = std::array<uint8_t, 32>; // Ed25519 public key / ledger address
using OrderHash = std::array<uint8_t, 32>; // Content address of an order
using Signature = std::array<uint8_t, 64>; // Raw Ed25519 signature
using Seed = std::array<uint8_t, 32>;      // Ed25519 private seed

using Amount = uint64_t;    // Token base units
using Nonce = uint64_t;     // Per-maker replay counter
using Timestamp = uint64_t; // Unix seconds

// Side of the order
// Bid gives quote for base, Ask gives base for quote
enum class Side : uint8_t { Bid = 0, Ask = 1 };

// Wire sizes
constexpr size_t kPublicKeySize = 32;
constexpr size_t kHashSize = 32;
constexpr size_t kSignatureSize = 64;
constexpr size_t kSeedSize = 32;
constexpr size_t kFullOrderSize = 225;
constexpr size_t kCompactOrderSize = 65;
constexpr size_t kHashedOrderSize = kFullOrderSize - kSignatureSize; // 161

// Maximum makers in a single match instruction
constexpr size_t kMaxMakers = 5;

} // namespace ordermill
