#include "addresses.hpp"
#include "error.hpp"

#include <cstring>
#include <utility>

namespace ordermill {

namespace seeds {

namespace {

Bytes literal(const char* text) { return Bytes(text, text + std::strlen(text)); }

template <size_t N> Bytes raw(const std::array<uint8_t, N>& value) { return Bytes(value.begin(), value.end()); }

} // namespace

std::vector<Bytes> exchange() { return {literal("central_state")}; }

std::vector<Bytes> orderStatus(const OrderHash& orderHash) { return {literal("order_status"), raw(orderHash)}; }

std::vector<Bytes> userNonce(const PublicKey& user) { return {literal("user_nonce"), raw(user)}; }

std::vector<Bytes> position(const PublicKey& owner, const PublicKey& market)
{
    return {literal("position"), raw(owner), raw(market)};
}

std::vector<Bytes> tokenAccount(const PublicKey& owner, const PublicKey& tokenProgram, const PublicKey& mint)
{
    return {raw(owner), raw(tokenProgram), raw(mint)};
}

} // namespace seeds

AddressBook::AddressBook(const ProgramConfig& config, AddressDeriver deriver)
    : m_config(config), m_deriver(std::move(deriver))
{
    if (!m_deriver) {
        throw ProtocolError(ErrorCode::MissingDeriver, "address book requires an address deriver");
    }
}

PublicKey AddressBook::exchange() const { return m_deriver(seeds::exchange(), m_config.settlementProgram).address; }

PublicKey AddressBook::orderStatus(const OrderHash& orderHash) const
{
    return m_deriver(seeds::orderStatus(orderHash), m_config.settlementProgram).address;
}

PublicKey AddressBook::userNonce(const PublicKey& user) const
{
    return m_deriver(seeds::userNonce(user), m_config.settlementProgram).address;
}

PublicKey AddressBook::position(const PublicKey& owner, const PublicKey& market) const
{
    return m_deriver(seeds::position(owner, market), m_config.settlementProgram).address;
}

PublicKey AddressBook::tokenAccount(const PublicKey& owner, const PublicKey& mint) const
{
    return m_deriver(seeds::tokenAccount(owner, m_config.tokenProgram, mint), m_config.associatedTokenProgram)
        .address;
}

} // namespace ordermill
