#pragma once

#include "types.hpp"

#include <array>
#include <cstring>
#include <string>

namespace ordermill::encoding {

// Little-endian integer at out[0..sizeof(T))
template <typename T> inline void putLe(uint8_t* out, T value)
{
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i));
    }
}

template <typename T> [[nodiscard]] inline T getLe(const uint8_t* in)
{
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return static_cast<T>(value);
}

template <typename T> inline void appendLe(Bytes& out, T value)
{
    uint8_t buffer[sizeof(T)];
    putLe(buffer, value);
    out.insert(out.end(), buffer, buffer + sizeof(T));
}

// Lower-case hex
[[nodiscard]] std::string toHex(const uint8_t* data, size_t size);
[[nodiscard]] Bytes fromHex(const std::string& text);

// Bitcoin-alphabet base58 (ledger address form)
[[nodiscard]] std::string toBase58(const uint8_t* data, size_t size);
[[nodiscard]] Bytes fromBase58(const std::string& text);

// Throws ProtocolError(InvalidLength) unless bytes.size() == N
void requireSize(const Bytes& bytes, size_t expected, const char* what);

template <size_t N> [[nodiscard]] std::string toHex(const std::array<uint8_t, N>& value)
{
    return toHex(value.data(), value.size());
}

template <size_t N> [[nodiscard]] std::string toBase58(const std::array<uint8_t, N>& value)
{
    return toBase58(value.data(), value.size());
}

template <size_t N> [[nodiscard]] std::array<uint8_t, N> arrayFromHex(const std::string& text, const char* what)
{
    Bytes bytes = fromHex(text);
    requireSize(bytes, N, what);
    std::array<uint8_t, N> value{};
    std::memcpy(value.data(), bytes.data(), N);
    return value;
}

template <size_t N> [[nodiscard]] std::array<uint8_t, N> arrayFromBase58(const std::string& text, const char* what)
{
    Bytes bytes = fromBase58(text);
    requireSize(bytes, N, what);
    std::array<uint8_t, N> value{};
    std::memcpy(value.data(), bytes.data(), N);
    return value;
}

[[nodiscard]] inline PublicKey publicKeyFromBase58(const std::string& text)
{
    return arrayFromBase58<kPublicKeySize>(text, "public key");
}

} // namespace ordermill::encoding
