#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the latchkey library.

#include <cstdint>
#include <string_view>

namespace latchkey::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Persistence (0x0200 - 0x02FF)
    PersistenceError = 0x0200,
    PersistenceWriteFailed = 0x0201,
    PersistenceReadFailed = 0x0202,
    PersistenceTimeout = 0x0203,
    NotConnected = 0x0204,
    QueryFailed = 0x0205,
    TransactionFailed = 0x0206,
    ConnectionPoolExhausted = 0x0207,

    // Crypto (0x0300 - 0x03FF)
    CryptoError = 0x0300,
    CryptoInvalidKey = 0x0301,
    CryptoMalformedInput = 0x0302,
    CryptoDecryptFailed = 0x0303,
    CryptoRandomFailed = 0x0304,

    // Auth (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    TokenExpired = 0x0501,
    TokenRevoked = 0x0502,
    InvalidToken = 0x0503,
    UserNotFound = 0x0504,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0200: return "Persistence";
        case 0x0300: return "Crypto";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace latchkey::foundation
