#pragma once

#include "programconfig.hpp"
#include "types.hpp"

#include <functional>
#include <vector>

namespace ordermill {

struct DerivedAddress {
    PublicKey address;
    uint8_t bump;
};

// Ledger program-address derivation (hash of seeds, off-curve search).
// Supplied by the caller's ledger SDK; builders only consume it.
using AddressDeriver = std::function<DerivedAddress(const std::vector<Bytes>& seeds, const PublicKey& programId)>;

// Seeds of the settlement program's accounts
namespace seeds {

std::vector<Bytes> exchange();
std::vector<Bytes> orderStatus(const OrderHash& orderHash);
std::vector<Bytes> userNonce(const PublicKey& user);
std::vector<Bytes> position(const PublicKey& owner, const PublicKey& market);
std::vector<Bytes> tokenAccount(const PublicKey& owner, const PublicKey& tokenProgram, const PublicKey& mint);

} // namespace seeds

// Resolves the settlement program's accounts through one deriver and config
class AddressBook {
public:
    AddressBook(const ProgramConfig& config, AddressDeriver deriver);

    [[nodiscard]] PublicKey exchange() const;
    [[nodiscard]] PublicKey orderStatus(const OrderHash& orderHash) const;
    [[nodiscard]] PublicKey userNonce(const PublicKey& user) const;
    [[nodiscard]] PublicKey position(const PublicKey& owner, const PublicKey& market) const;

    // Conditional-token account of owner for mint (associated-token program)
    [[nodiscard]] PublicKey tokenAccount(const PublicKey& owner, const PublicKey& mint) const;

    [[nodiscard]] const ProgramConfig& config() const { return m_config; }

private:
    ProgramConfig m_config;
    AddressDeriver m_deriver;
};

} // namespace ordermill
