#pragma once

/// @file auth_logger.hpp
/// @brief AuthLogger wrapping kcenon logger_system for structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/foundation/types.hpp"

namespace latchkey::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Library-wide operations
    Crypto     = 1, ///< Encryption, hashing, random generation
    Csrf       = 2, ///< Anti-forgery token checks
    RememberMe = 3, ///< Persistent-login token lifecycle
    Middleware = 4, ///< Request-time identity bridging
    Store      = 5, ///< Token persistence adapters
    Config     = 6  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Crypto", "Csrf", "RememberMe", "Middleware", "Store", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Shorten a token digest for log output.
///
/// Only the first 8 hex characters are kept so operators can correlate
/// entries without the log carrying a full lookup key.
[[nodiscard]] inline std::string digestPrefix(std::string_view digest) {
    constexpr std::size_t kPrefix = 8;
    if (digest.size() <= kPrefix) {
        return std::string(digest);
    }
    return std::string(digest.substr(0, kPrefix)) + "...";
}

/// Structured context data attached to log entries.
///
/// Never put raw tokens, CSRF values or key material in here.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = UserId(42);
///   ctx.extra["digest"] = digestPrefix(digest);
///   logger.logWithContext(LogLevel::Info, LogCategory::RememberMe,
///                         "Token issued", ctx);
/// @endcode
struct LogContext {
    std::optional<UserId> userId;
    std::optional<TokenId> tokenId;
    std::optional<std::string> ipAddress;
    std::optional<std::string> requestId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Crypto     | Warning       |
/// | Csrf       | Info          |
/// | RememberMe | Info          |
/// | Middleware | Info          |
/// | Store      | Info          |
/// | Config     | Info          |
class AuthLogger {
public:
    AuthLogger();
    ~AuthLogger();

    // Non-copyable, movable.
    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;
    AuthLogger(AuthLogger&&) noexcept;
    AuthLogger& operator=(AuthLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    AuthResult<void> flush();

    /// Get the process-wide AuthLogger instance.
    static AuthLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace latchkey::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope, outside any namespace)
// ---------------------------------------------------------------------------

/// @name LATCHKEY_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// LATCHKEY_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef LATCHKEY_MIN_LOG_LEVEL
    #define LATCHKEY_MIN_LOG_LEVEL 0
#endif

#define LATCHKEY_LOG(level, cat, msg)                                                  \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= LATCHKEY_MIN_LOG_LEVEL &&                       \
            ::latchkey::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                              \
            ::latchkey::foundation::AuthLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define LATCHKEY_LOG_DEBUG(cat, msg) \
    LATCHKEY_LOG(::latchkey::foundation::LogLevel::Debug, (cat), (msg))

#define LATCHKEY_LOG_INFO(cat, msg) \
    LATCHKEY_LOG(::latchkey::foundation::LogLevel::Info, (cat), (msg))

#define LATCHKEY_LOG_WARN(cat, msg) \
    LATCHKEY_LOG(::latchkey::foundation::LogLevel::Warning, (cat), (msg))

#define LATCHKEY_LOG_ERROR(cat, msg) \
    LATCHKEY_LOG(::latchkey::foundation::LogLevel::Error, (cat), (msg))

/// @}
