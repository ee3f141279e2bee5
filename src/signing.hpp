#pragma once

#include "crypto.hpp"
#include "order.hpp"

namespace ordermill::signing {

// Signature over codec::hash(order); order.maker is not touched
[[nodiscard]] Signature sign(const Order& order, const crypto::Keypair& keypair);

// Copy of order with maker set to the key's public identity, then signed
[[nodiscard]] Order signAndAttach(const Order& order, const crypto::Keypair& keypair);

// Ed25519 check of the order hash against order.maker.
// Unsigned orders are rejected without any cryptographic work. Never throws.
[[nodiscard]] bool verify(const Order& order);

// expiration == 0 never expires; otherwise expired once now >= expiration
[[nodiscard]] bool isExpired(const Order& order, Timestamp now);

// Throws ProtocolError: Authentication (Unsigned, BadSignature) or Temporal (Expired)
void requireValid(const Order& order, Timestamp now);

} // namespace ordermill::signing
