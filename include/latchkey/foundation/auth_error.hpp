#pragma once

/// @file auth_error.hpp
/// @brief Library error type used with Result<T, AuthError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "latchkey/foundation/error_code.hpp"

namespace latchkey::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data for debugging.
///
/// The message must never contain a raw token, CSRF value or key.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AuthError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Store unreachable, timed out or write failed.
    [[nodiscard]] bool isPersistenceError() const noexcept {
        return (static_cast<uint32_t>(code_) & 0xFF00) == 0x0200;
    }

    /// Bad key, corrupted ciphertext or CSPRNG failure.
    [[nodiscard]] bool isCryptoError() const noexcept {
        return (static_cast<uint32_t>(code_) & 0xFF00) == 0x0300;
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace latchkey::foundation
