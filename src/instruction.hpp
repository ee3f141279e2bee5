#pragma once

#include "types.hpp"

#include <vector>

namespace ordermill {

struct AccountMeta {
    PublicKey key;   // Account address
    bool isSigner;   // Must sign the transaction
    bool isWritable; // Program may modify it

    bool operator==(const AccountMeta& other) const
    {
        return key == other.key && isSigner == other.isSigner && isWritable == other.isWritable;
    }
};

struct Instruction {
    PublicKey programId;               // Program that executes it
    std::vector<AccountMeta> accounts; // Ordered account references
    Bytes data;                        // Opaque payload
};

// Instructions execute in order and apply atomically
struct Transaction {
    PublicKey feePayer;
    std::vector<Instruction> instructions;
};

[[nodiscard]] inline AccountMeta signerWritable(const PublicKey& key) { return {key, true, true}; }
[[nodiscard]] inline AccountMeta writable(const PublicKey& key) { return {key, false, true}; }
[[nodiscard]] inline AccountMeta readonly(const PublicKey& key) { return {key, false, false}; }

} // namespace ordermill
