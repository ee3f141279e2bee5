#include "../src/addresses.hpp"
#include "../src/error.hpp"
#include "fixtures.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace ordermill;
using namespace fixtures;

namespace {

std::string asText(const Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); }

struct DeriveCall {
    std::vector<Bytes> seeds;
    PublicKey programId;
};

} // namespace

class AddressBookTest : public ::testing::Test {
protected:
    AddressBook recordingBook()
    {
        return AddressBook(config, [this](const std::vector<Bytes>& seeds, const PublicKey& programId) {
            calls.push_back({seeds, programId});
            return testDeriver(seeds, programId);
        });
    }

    ProgramConfig config = ProgramConfig::standard();
    std::vector<DeriveCall> calls;
};

TEST_F(AddressBookTest, SeedLiterals)
{
    auto exchange = seeds::exchange();
    ASSERT_EQ(1u, exchange.size());
    EXPECT_EQ("central_state", asText(exchange[0]));

    auto status = seeds::orderStatus(key(0x44));
    ASSERT_EQ(2u, status.size());
    EXPECT_EQ("order_status", asText(status[0]));
    EXPECT_EQ(Bytes(32, 0x44), status[1]);

    EXPECT_EQ("user_nonce", asText(seeds::userNonce(key(1))[0]));

    auto position = seeds::position(key(1), kMarket);
    ASSERT_EQ(3u, position.size());
    EXPECT_EQ("position", asText(position[0]));
    EXPECT_EQ(Bytes(32, 0xA1), position[2]);
}

TEST_F(AddressBookTest, SettlementAccountsUseSettlementProgram)
{
    AddressBook book = recordingBook();

    PublicKey exchange = book.exchange();
    (void)book.orderStatus(key(0x44));
    (void)book.userNonce(key(0x55));
    (void)book.position(key(0x55), kMarket);

    ASSERT_EQ(4u, calls.size());
    for (const auto& call : calls) {
        EXPECT_EQ(config.settlementProgram, call.programId);
    }
    EXPECT_EQ(testDeriver(seeds::exchange(), config.settlementProgram).address, exchange);
}

TEST_F(AddressBookTest, TokenAccountUsesAssociatedTokenProgram)
{
    AddressBook book = recordingBook();
    (void)book.tokenAccount(key(0x66), kBaseMint);

    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ(config.associatedTokenProgram, calls[0].programId);
    ASSERT_EQ(3u, calls[0].seeds.size());
    EXPECT_EQ(Bytes(32, 0x66), calls[0].seeds[0]);
    EXPECT_EQ(Bytes(config.tokenProgram.begin(), config.tokenProgram.end()), calls[0].seeds[1]);
    EXPECT_EQ(Bytes(32, 0xB1), calls[0].seeds[2]);
}

TEST_F(AddressBookTest, DistinctSeedsGiveDistinctAddresses)
{
    AddressBook book(config, testDeriver);
    EXPECT_NE(book.userNonce(key(1)), book.userNonce(key(2)));
    EXPECT_NE(book.position(key(1), kMarket), book.userNonce(key(1)));
    EXPECT_EQ(book.orderStatus(key(9)), book.orderStatus(key(9)));
}

TEST_F(AddressBookTest, RequiresDeriver)
{
    try {
        AddressBook book(config, AddressDeriver{});
        FAIL() << "empty deriver accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::MissingDeriver, e.code());
        EXPECT_EQ(ErrorCategory::Configuration, e.category());
    }
}
