#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> type alias for library error handling.

#include "latchkey/core/result.hpp"
#include "latchkey/foundation/auth_error.hpp"

namespace latchkey::foundation {

/// Result type specialized with AuthError.
///
/// Store adapters, crypto helpers and the token lifecycle operations that
/// must report failure to their caller return AuthResult<T>.
///
/// Example:
/// @code
///   AuthResult<std::string> loadKey(std::string_view hex) {
///       if (hex.size() != 64) {
///           return AuthResult<std::string>::err(
///               AuthError(ErrorCode::CryptoInvalidKey, "key must be 32 bytes"));
///       }
///       return AuthResult<std::string>::ok(std::string(hex));
///   }
/// @endcode
template <typename T>
using AuthResult = latchkey::Result<T, AuthError>;

}  // namespace latchkey::foundation
