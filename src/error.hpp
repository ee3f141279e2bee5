#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ordermill {

// Coarse failure class, lets a caller tell "reject this order" from "reject this batch"
enum class ErrorCategory : uint8_t {
    Format = 1,         // Wrong-length or malformed bytes
    Authentication = 2, // Missing or invalid signature
    Temporal = 3,       // Expired relative to the supplied "now"
    Economic = 4,       // Prices or fill amounts do not agree
    Structural = 5,     // Shape of a request (counts, lengths, bitmask)
    Configuration = 6   // Program identities / config file
};

enum class ErrorCode : uint8_t {
    InvalidLength = 1,
    InvalidSide,
    InvalidPadding,
    InvalidEncoding,
    NonceMismatch,
    Unsigned,
    BadSignature,
    CryptoFailure,
    Expired,
    ZeroAmount,
    FillExceedsAmount,
    InconsistentFill,
    OrdersDoNotCross,
    Overflow,
    SameSide,
    NoMakers,
    TooManyMakers,
    LengthMismatch,
    InvalidBitmask,
    MarketMismatch,
    DuplicateOrder,
    EmptyBatch,
    BatchTooLarge,
    InvalidTarget,
    ConfigUnreadable,
    ConfigMissingKey,
    MissingDeriver
};

[[nodiscard]] const char* categoryName(ErrorCategory category);
[[nodiscard]] ErrorCategory categoryOf(ErrorCode code);

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCategory category() const { return m_category; }
    [[nodiscard]] ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
    ErrorCategory m_category;
};

} // namespace ordermill
