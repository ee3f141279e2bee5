#pragma once

#include "types.hpp"

#include <string>

namespace ordermill {

// Ledger program identities the instruction builders address.
// Always passed explicitly; nothing in the library falls back to a hidden default.
struct ProgramConfig {
    PublicKey settlementProgram;      // Exchange program that executes settlement
    PublicKey verifierProgram;        // Native Ed25519 signature-verification program
    PublicKey tokenProgram;           // Token program owning conditional-token accounts
    PublicKey associatedTokenProgram; // Derives per-owner token accounts
    PublicKey systemProgram;
    PublicKey instructionsSysvar;     // Lets settlement introspect verification instructions

    // Well-known deployment identities
    [[nodiscard]] static ProgramConfig standard();

    // Load from a flat JSON object of base58 identities. "settlement_program" is
    // required; every other key defaults to standard(). Throws ProtocolError(Configuration).
    [[nodiscard]] static ProgramConfig loadFromFile(const std::string& path);
    [[nodiscard]] static ProgramConfig parse(const std::string& json);
};

} // namespace ordermill
