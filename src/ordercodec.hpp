#pragma once

#include "order.hpp"

#include <array>
#include <string>

namespace ordermill::codec {

using FullOrderBytes = std::array<uint8_t, kFullOrderSize>;
using CompactOrderBytes = std::array<uint8_t, kCompactOrderSize>;

// Prefixed to the canonical encoding before hashing; no other signed message uses it
constexpr char kOrderHashDomain[] = "ordermill:order-hash:v1"; // hashed with its trailing NUL
constexpr size_t kOrderHashDomainSize = sizeof(kOrderHashDomain);

// Full layout (225 bytes, little-endian):
//   [0..8) nonce  [8..40) maker  [40..72) market  [72..104) baseMint  [104..136) quoteMint
//   [136] side  [137..145) makerAmount  [145..153) takerAmount  [153..161) expiration
//   [161..225) signature (all-zero when unsigned)
[[nodiscard]] FullOrderBytes encodeFull(const Order& order);

// Throws ProtocolError(Format) unless size is exactly 225 and side is 0 or 1
[[nodiscard]] Order decodeFull(const uint8_t* data, size_t size);
[[nodiscard]] inline Order decodeFull(const Bytes& data) { return decodeFull(data.data(), data.size()); }

// Compact layout (65 bytes):
//   [0..4) nonce low 32 bits  [4..36) maker  [36] side  [37..45) makerAmount
//   [45..53) takerAmount  [53..61) expiration  [61..65) zero pad
[[nodiscard]] CompactOrderBytes encodeCompact(const CompactOrder& order);

// Throws ProtocolError(Format) unless size is exactly 65, side is valid and the pad is zero
[[nodiscard]] CompactOrder decodeCompact(const uint8_t* data, size_t size);
[[nodiscard]] inline CompactOrder decodeCompact(const Bytes& data) { return decodeCompact(data.data(), data.size()); }

// LOSSY: keeps only the low 32 bits of the nonce. A compact order cannot be
// mapped back to its full nonce; see expandCompact.
[[nodiscard]] CompactOrder toCompact(const Order& order);

// Rebuild a full order from a compact one plus transaction context.
// fullNonce must come from the caller's own record of the order; its low
// 32 bits must equal the compact nonce (ProtocolError NonceMismatch otherwise).
[[nodiscard]] Order expandCompact(const CompactOrder& compact, Nonce fullNonce, const PublicKey& market,
                                  const PublicKey& baseMint, const PublicKey& quoteMint,
                                  const std::optional<Signature>& signature);

// SHA3-256(domain tag || first 161 bytes of the full encoding). Independent of the signature.
[[nodiscard]] OrderHash hash(const Order& order);

// "<base58(baseMint)[0..8)>_<base58(quoteMint)[0..8)>"
[[nodiscard]] std::string orderbookId(const Order& order);

[[nodiscard]] Side sideFromByte(uint8_t value);

} // namespace ordermill::codec
