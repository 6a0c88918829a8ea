/// @file auth_logger.cpp
/// @brief AuthLogger implementation wrapping kcenon logger_system.

#include "latchkey/foundation/auth_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace latchkey::foundation {

// ---------------------------------------------------------------------------
// Level mapping: latchkey -> kcenon
// ---------------------------------------------------------------------------
static kcenon::common::interfaces::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kcenon::common::interfaces::log_level::trace;
        case LogLevel::Debug:    return kcenon::common::interfaces::log_level::debug;
        case LogLevel::Info:     return kcenon::common::interfaces::log_level::info;
        case LogLevel::Warning:  return kcenon::common::interfaces::log_level::warning;
        case LogLevel::Error:    return kcenon::common::interfaces::log_level::error;
        case LogLevel::Critical: return kcenon::common::interfaces::log_level::critical;
        case LogLevel::Off:      return kcenon::common::interfaces::log_level::off;
    }
    return kcenon::common::interfaces::log_level::info;
}

// ---------------------------------------------------------------------------
// Default log levels per category
// ---------------------------------------------------------------------------
static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Warning,  // Crypto
    LogLevel::Info,     // Csrf
    LogLevel::Info,     // RememberMe
    LogLevel::Info,     // Middleware
    LogLevel::Info,     // Store
    LogLevel::Info      // Config
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.userId && ctx.userId->isValid()) {
        append("user_id", std::to_string(ctx.userId->value()));
    }
    if (ctx.tokenId && ctx.tokenId->isValid()) {
        append("token_id", std::to_string(ctx.tokenId->value()));
    }
    if (ctx.ipAddress && !ctx.ipAddress->empty()) {
        append("ip", *ctx.ipAddress);
    }
    if (ctx.requestId && !ctx.requestId->empty()) {
        append("request_id", *ctx.requestId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct AuthLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("latchkey.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kcenon::common::interfaces::ILogger> getLogger(
        LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kcenon::common::interfaces::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first, default logger when the name is unregistered
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger->is_enabled(kcenon::common::interfaces::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger->is_enabled(kcenon::common::interfaces::log_level::off)
                || defaultLogger != kcenon::common::interfaces::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        auto logger = getLogger(cat);

        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }

        (void)logger->log(mapLevel(level), formatted);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
AuthLogger::AuthLogger() : impl_(std::make_unique<Impl>()) {}

AuthLogger::~AuthLogger() = default;

AuthLogger::AuthLogger(AuthLogger&&) noexcept = default;
AuthLogger& AuthLogger::operator=(AuthLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void AuthLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void AuthLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void AuthLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel AuthLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool AuthLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
AuthResult<void> AuthLogger::flush() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return AuthResult<void>::ok();
}

// ---------------------------------------------------------------------------
// instance()
// ---------------------------------------------------------------------------
AuthLogger& AuthLogger::instance() {
    static AuthLogger inst;
    return inst;
}

} // namespace latchkey::foundation
