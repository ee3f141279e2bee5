#include "encoding.hpp"
#include "error.hpp"

#include <algorithm>

namespace ordermill::encoding {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int base58Value(char c)
{
    const char* found = std::strchr(kBase58Alphabet, c);
    if (c == '\0' || found == nullptr)
        return -1;
    return static_cast<int>(found - kBase58Alphabet);
}

} // namespace

std::string toHex(const uint8_t* data, size_t size)
{
    std::string text;
    text.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        text.push_back(kHexDigits[data[i] >> 4]);
        text.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return text;
}

Bytes fromHex(const std::string& text)
{
    if (text.size() % 2 != 0) {
        throw ProtocolError(ErrorCode::InvalidEncoding, "hex string has odd length " + std::to_string(text.size()));
    }

    Bytes bytes;
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int high = hexValue(text[i]);
        int low = hexValue(text[i + 1]);
        if (high < 0 || low < 0) {
            throw ProtocolError(ErrorCode::InvalidEncoding, "invalid hex digit at position " + std::to_string(i));
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return bytes;
}

std::string toBase58(const uint8_t* data, size_t size)
{
    size_t leadingZeros = 0;
    while (leadingZeros < size && data[leadingZeros] == 0)
        ++leadingZeros;

    // Big-endian base-58 digits, repeated division of the input
    std::vector<uint8_t> digits;
    digits.reserve(size * 138 / 100 + 1);
    for (size_t i = leadingZeros; i < size; ++i) {
        int carry = data[i];
        for (auto& digit : digits) {
            carry += digit << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string text(leadingZeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        text.push_back(kBase58Alphabet[*it]);
    }
    return text;
}

Bytes fromBase58(const std::string& text)
{
    size_t leadingOnes = 0;
    while (leadingOnes < text.size() && text[leadingOnes] == '1')
        ++leadingOnes;

    // Little-endian base-256 accumulator
    Bytes bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);
    for (size_t i = leadingOnes; i < text.size(); ++i) {
        int carry = base58Value(text[i]);
        if (carry < 0) {
            throw ProtocolError(ErrorCode::InvalidEncoding,
                                "invalid base58 character '" + std::string(1, text[i]) + "'");
        }
        for (auto& byte : bytes) {
            carry += byte * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    bytes.insert(bytes.end(), leadingOnes, 0);
    std::reverse(bytes.begin(), bytes.end());
    return bytes;
}

void requireSize(const Bytes& bytes, size_t expected, const char* what)
{
    if (bytes.size() != expected) {
        throw ProtocolError(ErrorCode::InvalidLength, std::string(what) + ": expected " + std::to_string(expected) +
                                                          " bytes, got " + std::to_string(bytes.size()));
    }
}

} // namespace ordermill::encoding
