#include "../src/crypto.hpp"
#include "../src/encoding.hpp"
#include "../src/error.hpp"
#include "../src/ordercodec.hpp"
#include "../src/signing.hpp"
#include "fixtures.hpp"
#include <gtest/gtest.h>

using namespace ordermill;
using namespace fixtures;

class SigningTest : public ::testing::Test {
protected:
    crypto::Keypair alice = crypto::Keypair::fromSeed(seed(0x01));
    crypto::Keypair bob = crypto::Keypair::fromSeed(seed(0x02));
    Order order = makeBid(params(key(0x00), 42, 100, 50, kNow + 60));
};

TEST_F(SigningTest, KeypairFromRfc8032Seed)
{
    auto rfcSeed = encoding::arrayFromHex<kSeedSize>(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60", "seed");
    auto keypair = crypto::Keypair::fromSeed(rfcSeed);
    EXPECT_EQ("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a",
              encoding::toHex(keypair.publicKey()));
    EXPECT_EQ(rfcSeed, keypair.seed());
}

TEST_F(SigningTest, GeneratedKeysDiffer)
{
    auto first = crypto::Keypair::generate();
    auto second = crypto::Keypair::generate();
    EXPECT_NE(first.publicKey(), second.publicKey());
}

TEST_F(SigningTest, SignAndAttachVerifies)
{
    Order signedOrder = signing::signAndAttach(order, alice);

    EXPECT_EQ(alice.publicKey(), signedOrder.maker);
    ASSERT_TRUE(signedOrder.isSigned());
    EXPECT_TRUE(signing::verify(signedOrder));
}

TEST_F(SigningTest, SignaturesAreDeterministic)
{
    Order withMaker = order;
    withMaker.maker = alice.publicKey();
    EXPECT_EQ(signing::sign(withMaker, alice), signing::sign(withMaker, alice));
}

TEST_F(SigningTest, SignDoesNotSetMaker)
{
    // maker stays key(0x00), so the signature cannot verify against it
    Order detached = order;
    detached.signature = signing::sign(order, alice);
    EXPECT_EQ(key(0x00), detached.maker);
    EXPECT_FALSE(signing::verify(detached));
}

TEST_F(SigningTest, VerifyRejectsUnsigned)
{
    EXPECT_FALSE(signing::verify(order));

    Order zeroSignature = order;
    zeroSignature.maker = alice.publicKey();
    zeroSignature.signature = Signature{};
    EXPECT_FALSE(zeroSignature.isSigned());
    EXPECT_FALSE(signing::verify(zeroSignature));
}

TEST_F(SigningTest, VerifyRejectsOtherKey)
{
    Order signedOrder = signing::signAndAttach(order, alice);
    signedOrder.signature = signing::sign(signedOrder, bob);
    EXPECT_FALSE(signing::verify(signedOrder));
}

TEST_F(SigningTest, VerifyRejectsMutationAfterSigning)
{
    Order signedOrder = signing::signAndAttach(order, alice);

    Order moreAmount = signedOrder;
    moreAmount.makerAmount += 1;
    EXPECT_FALSE(signing::verify(moreAmount));

    Order otherMarket = signedOrder;
    otherMarket.market = key(0xEE);
    EXPECT_FALSE(signing::verify(otherMarket));

    Order flippedBit = signedOrder;
    (*flippedBit.signature)[10] ^= 0x01;
    EXPECT_FALSE(signing::verify(flippedBit));
}

TEST_F(SigningTest, RawVerifyFailsClosedOnLengths)
{
    Order signedOrder = signing::signAndAttach(order, alice);
    OrderHash message = codec::hash(signedOrder);
    const Signature& signature = *signedOrder.signature;
    const PublicKey& publicKey = signedOrder.maker;

    EXPECT_TRUE(crypto::ed25519Verify(publicKey, message, signature));
    EXPECT_FALSE(crypto::ed25519Verify(publicKey.data(), 31, message.data(), 32, signature.data(), 64));
    EXPECT_FALSE(crypto::ed25519Verify(publicKey.data(), 32, message.data(), 31, signature.data(), 64));
    EXPECT_FALSE(crypto::ed25519Verify(publicKey.data(), 32, message.data(), 32, signature.data(), 63));
}

TEST_F(SigningTest, ExpirationBoundary)
{
    Order never = order;
    never.expiration = 0;
    EXPECT_FALSE(signing::isExpired(never, 0));
    EXPECT_FALSE(signing::isExpired(never, UINT64_MAX));

    EXPECT_FALSE(signing::isExpired(order, kNow));
    EXPECT_FALSE(signing::isExpired(order, kNow + 59));
    EXPECT_TRUE(signing::isExpired(order, kNow + 60));
    EXPECT_TRUE(signing::isExpired(order, kNow + 61));
}

TEST_F(SigningTest, RequireValidReportsCategory)
{
    try {
        signing::requireValid(order, kNow);
        FAIL() << "unsigned order accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::Unsigned, e.code());
        EXPECT_EQ(ErrorCategory::Authentication, e.category());
    }

    Order signedOrder = signing::signAndAttach(order, alice);
    EXPECT_NO_THROW(signing::requireValid(signedOrder, kNow));

    Order tampered = signedOrder;
    tampered.takerAmount = 1;
    try {
        signing::requireValid(tampered, kNow);
        FAIL() << "tampered order accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::BadSignature, e.code());
    }

    try {
        signing::requireValid(signedOrder, kNow + 60);
        FAIL() << "expired order accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::Expired, e.code());
        EXPECT_EQ(ErrorCategory::Temporal, e.category());
    }
}
