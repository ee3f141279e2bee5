#include "signing.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "ordercodec.hpp"

namespace ordermill::signing {

Signature sign(const Order& order, const crypto::Keypair& keypair) { return keypair.sign(codec::hash(order)); }

Order signAndAttach(const Order& order, const crypto::Keypair& keypair)
{
    Order signedOrder = order;
    signedOrder.maker = keypair.publicKey();
    signedOrder.signature = sign(signedOrder, keypair);
    return signedOrder;
}

bool verify(const Order& order)
{
    if (!order.isSigned()) {
        return false;
    }

    try {
        return crypto::ed25519Verify(order.maker, codec::hash(order), *order.signature);
    } catch (const ProtocolError&) {
        // Hashing failure inside the crypto library: fail closed
        return false;
    }
}

bool isExpired(const Order& order, Timestamp now) { return order.expiration != 0 && now >= order.expiration; }

void requireValid(const Order& order, Timestamp now)
{
    if (!order.isSigned()) {
        throw ProtocolError(ErrorCode::Unsigned, "order " + std::to_string(order.nonce) + " from maker " +
                                                     encoding::toBase58(order.maker) + " is not signed");
    }
    if (!verify(order)) {
        throw ProtocolError(ErrorCode::BadSignature, "signature of order " + std::to_string(order.nonce) +
                                                         " does not verify for maker " +
                                                         encoding::toBase58(order.maker));
    }
    if (isExpired(order, now)) {
        throw ProtocolError(ErrorCode::Expired, "order " + std::to_string(order.nonce) + " expired at " +
                                                    std::to_string(order.expiration) + " (now " +
                                                    std::to_string(now) + ")");
    }
}

} // namespace ordermill::signing
