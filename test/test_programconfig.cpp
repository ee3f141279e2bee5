#include "../src/encoding.hpp"
#include "../src/error.hpp"
#include "../src/programconfig.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

using namespace ordermill;

class ProgramConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // Create temporary test file
        std::ofstream out(kPath);
        out << R"({
            "settlement_program": "11111111111111111111111111111112",
            "token_program": "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb"
        })";
        out.close();
    }

    void TearDown() override { std::remove(kPath); }

    static constexpr const char* kPath = "test_programs.json";
};

TEST_F(ProgramConfigTest, StandardIdentities)
{
    ProgramConfig config = ProgramConfig::standard();
    EXPECT_EQ(PublicKey{}, config.systemProgram);
    EXPECT_EQ("Ed25519SigVerify111111111111111111111111111", encoding::toBase58(config.verifierProgram));
    EXPECT_EQ("Aumw7EC9nnxDjQFzr1fhvXvnG3Rn3Bb5E3kbcbLrBdEk", encoding::toBase58(config.settlementProgram));
    EXPECT_EQ("Sysvar1nstructions1111111111111111111111111", encoding::toBase58(config.instructionsSysvar));
}

TEST_F(ProgramConfigTest, LoadFromFileAppliesDefaults)
{
    ProgramConfig config = ProgramConfig::loadFromFile(kPath);
    ProgramConfig defaults = ProgramConfig::standard();

    PublicKey expectedSettlement{};
    expectedSettlement[31] = 1;
    EXPECT_EQ(expectedSettlement, config.settlementProgram);
    EXPECT_EQ(defaults.tokenProgram, config.tokenProgram);
    EXPECT_EQ(defaults.verifierProgram, config.verifierProgram);
    EXPECT_EQ(defaults.associatedTokenProgram, config.associatedTokenProgram);
}

TEST_F(ProgramConfigTest, ShippedConfigMatchesStandard)
{
    ProgramConfig config = ProgramConfig::loadFromFile("config/programs.json");
    ProgramConfig defaults = ProgramConfig::standard();
    EXPECT_EQ(defaults.settlementProgram, config.settlementProgram);
    EXPECT_EQ(defaults.verifierProgram, config.verifierProgram);
    EXPECT_EQ(defaults.tokenProgram, config.tokenProgram);
    EXPECT_EQ(defaults.associatedTokenProgram, config.associatedTokenProgram);
    EXPECT_EQ(defaults.systemProgram, config.systemProgram);
    EXPECT_EQ(defaults.instructionsSysvar, config.instructionsSysvar);
}

TEST_F(ProgramConfigTest, MissingFile)
{
    try {
        (void)ProgramConfig::loadFromFile("does_not_exist.json");
        FAIL() << "missing file accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::ConfigUnreadable, e.code());
        EXPECT_EQ(ErrorCategory::Configuration, e.category());
    }
}

TEST_F(ProgramConfigTest, SettlementProgramIsRequired)
{
    try {
        (void)ProgramConfig::parse(R"({"verifier_program": "Ed25519SigVerify111111111111111111111111111"})");
        FAIL() << "config without settlement program accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::ConfigMissingKey, e.code());
    }
}

TEST_F(ProgramConfigTest, NonStringValue)
{
    try {
        (void)ProgramConfig::parse(R"({"settlement_program": 12})");
        FAIL() << "numeric identity accepted";
    } catch (const ProtocolError& e) {
        // The key is present, so this is a malformed value rather than a missing key
        EXPECT_EQ(ErrorCode::ConfigUnreadable, e.code());
        EXPECT_EQ(ErrorCategory::Configuration, e.category());
    }

    try {
        (void)ProgramConfig::parse(R"({"settlement_program": "Aumw7EC9nnxDjQFzr1fhvXvnG3Rn3Bb5E3kbcbLrBdEk",
                                       "token_program": null})");
        FAIL() << "null identity accepted";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(ErrorCode::ConfigUnreadable, e.code());
    }
}

TEST_F(ProgramConfigTest, MalformedIdentity)
{
    const char* badCharacter = R"({"settlement_program": "0OIl"})";
    const char* wrongLength = R"({"settlement_program": "2NEpo7TZRRrLZSi2U"})";

    for (const char* json : {badCharacter, wrongLength}) {
        try {
            (void)ProgramConfig::parse(json);
            FAIL() << "accepted " << json;
        } catch (const ProtocolError& e) {
            EXPECT_EQ(ErrorCode::ConfigUnreadable, e.code());
            EXPECT_EQ(ErrorCategory::Configuration, e.category());
        }
    }
}
