#include "programconfig.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "jsonutils.hpp"

#include <fstream>
#include <sstream>

namespace ordermill {

using namespace json;

namespace {

PublicKey identityOrDefault(const std::string& json, const std::string& key, const PublicKey& fallback)
{
    auto value = extractString(json, key);
    if (!value.has_value()) {
        if (hasKey(json, key)) {
            throw ProtocolError(ErrorCode::ConfigUnreadable, "config key '" + key + "' must be a base58 string");
        }
        return fallback;
    }

    try {
        return encoding::publicKeyFromBase58(*value);
    } catch (const ProtocolError& e) {
        throw ProtocolError(ErrorCode::ConfigUnreadable, "config key '" + key + "': " + e.what());
    }
}

} // namespace

ProgramConfig ProgramConfig::standard()
{
    ProgramConfig config{};
    config.settlementProgram = encoding::publicKeyFromBase58("Aumw7EC9nnxDjQFzr1fhvXvnG3Rn3Bb5E3kbcbLrBdEk");
    config.verifierProgram = encoding::publicKeyFromBase58("Ed25519SigVerify111111111111111111111111111");
    config.tokenProgram = encoding::publicKeyFromBase58("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb");
    config.associatedTokenProgram = encoding::publicKeyFromBase58("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
    config.systemProgram = encoding::publicKeyFromBase58("11111111111111111111111111111111");
    config.instructionsSysvar = encoding::publicKeyFromBase58("Sysvar1nstructions1111111111111111111111111");
    return config;
}

ProgramConfig ProgramConfig::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ProtocolError(ErrorCode::ConfigUnreadable, "failed to open program config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

ProgramConfig ProgramConfig::parse(const std::string& json)
{
    if (!hasKey(json, "settlement_program")) {
        throw ProtocolError(ErrorCode::ConfigMissingKey, "config key 'settlement_program' is required");
    }

    const ProgramConfig defaults = standard();
    ProgramConfig config{};
    config.settlementProgram = identityOrDefault(json, "settlement_program", defaults.settlementProgram);
    config.verifierProgram = identityOrDefault(json, "verifier_program", defaults.verifierProgram);
    config.tokenProgram = identityOrDefault(json, "token_program", defaults.tokenProgram);
    config.associatedTokenProgram =
        identityOrDefault(json, "associated_token_program", defaults.associatedTokenProgram);
    config.systemProgram = identityOrDefault(json, "system_program", defaults.systemProgram);
    config.instructionsSysvar = identityOrDefault(json, "instructions_sysvar", defaults.instructionsSysvar);
    return config;
}

} // namespace ordermill
