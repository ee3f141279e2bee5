#include "error.hpp"

namespace ordermill {

const char* categoryName(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Format:
        return "format";
    case ErrorCategory::Authentication:
        return "authentication";
    case ErrorCategory::Temporal:
        return "temporal";
    case ErrorCategory::Economic:
        return "economic";
    case ErrorCategory::Structural:
        return "structural";
    case ErrorCategory::Configuration:
        return "configuration";
    }
    return "unknown";
}

ErrorCategory categoryOf(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidLength:
    case ErrorCode::InvalidSide:
    case ErrorCode::InvalidPadding:
    case ErrorCode::InvalidEncoding:
    case ErrorCode::NonceMismatch:
        return ErrorCategory::Format;
    case ErrorCode::Unsigned:
    case ErrorCode::BadSignature:
    case ErrorCode::CryptoFailure:
        return ErrorCategory::Authentication;
    case ErrorCode::Expired:
        return ErrorCategory::Temporal;
    case ErrorCode::ZeroAmount:
    case ErrorCode::FillExceedsAmount:
    case ErrorCode::InconsistentFill:
    case ErrorCode::OrdersDoNotCross:
    case ErrorCode::Overflow:
        return ErrorCategory::Economic;
    case ErrorCode::SameSide:
    case ErrorCode::NoMakers:
    case ErrorCode::TooManyMakers:
    case ErrorCode::LengthMismatch:
    case ErrorCode::InvalidBitmask:
    case ErrorCode::MarketMismatch:
    case ErrorCode::DuplicateOrder:
    case ErrorCode::EmptyBatch:
    case ErrorCode::BatchTooLarge:
    case ErrorCode::InvalidTarget:
        return ErrorCategory::Structural;
    case ErrorCode::ConfigUnreadable:
    case ErrorCode::ConfigMissingKey:
    case ErrorCode::MissingDeriver:
        return ErrorCategory::Configuration;
    }
    return ErrorCategory::Structural;
}

ProtocolError::ProtocolError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(categoryName(categoryOf(code))) + " error: " + message), m_code(code),
      m_category(categoryOf(code))
{
}

} // namespace ordermill
