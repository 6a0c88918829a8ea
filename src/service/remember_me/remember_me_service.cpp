/// @file remember_me_service.cpp
/// @brief RememberMeService implementation.

#include "latchkey/service/remember_me_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>

#include "latchkey/foundation/auth_logger.hpp"
#include "latchkey/security/crypto_primitives.hpp"

namespace latchkey::service {

using foundation::AuthError;
using foundation::AuthLogger;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace crypto = security::crypto;

namespace {

std::string_view trimSpaces(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

/// An address-shaped string that fits the ip_address column: IPv4, IPv6
/// or either with a port.
bool plausibleAddress(std::string_view s) {
    if (s.empty() || s.size() > kMaxIpAddressLength) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) || c == '.' || c == ':' ||
               c == '[' || c == ']';
    });
}

/// Cut @p s to at most @p maxChars UTF-8 code points without splitting one.
std::string truncateUtf8(std::string s, std::size_t maxChars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (chars == maxChars) {
            s.resize(i);
            break;
        }
        ++chars;
    }
    return s;
}

/// Log a lifecycle event. Only a digest prefix ever reaches the log.
void logEvent(LogLevel level, std::string_view msg, std::optional<UserId> userId,
              std::string_view tokenHash = {}, std::optional<TokenId> tokenId = {}) {
    auto& logger = AuthLogger::instance();
    if (!logger.isEnabled(level, LogCategory::RememberMe)) {
        return;
    }
    LogContext ctx;
    ctx.userId = userId;
    ctx.tokenId = tokenId;
    if (!tokenHash.empty()) {
        ctx.extra["digest"] = foundation::digestPrefix(tokenHash);
    }
    logger.logWithContext(level, LogCategory::RememberMe, msg, ctx);
}

} // namespace

RememberMeService::RememberMeService(RememberMeConfig config,
                                     std::shared_ptr<IRememberMeStore> store,
                                     std::shared_ptr<IUserRepository> users,
                                     Clock clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      users_(std::move(users)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

TimePoint RememberMeService::now() const {
    return clock_();
}

// =============================================================================
// Issuance
// =============================================================================

std::string RememberMeService::clientAddress(const http::IHttpRequest& request) {
    if (auto forwarded = request.header("X-Forwarded-For")) {
        std::string_view list = *forwarded;
        auto first = trimSpaces(list.substr(0, list.find(',')));
        if (plausibleAddress(first)) {
            return std::string(first);
        }
        if (!first.empty()) {
            LATCHKEY_LOG_DEBUG(LogCategory::RememberMe,
                "ignoring malformed X-Forwarded-For entry");
        }
    }
    if (auto peer = request.remoteAddress(); peer && plausibleAddress(*peer)) {
        return *peer;
    }
    return "unknown";
}

AuthResult<std::string> RememberMeService::create(UserId userId,
                                                  const http::IHttpRequest& request,
                                                  std::optional<std::string> deviceName) {
    if (!userId.isValid()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "user id must be set"));
    }

    auto issuedAt = now();
    auto headroom = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max() - issuedAt);
    if (config_.tokenLifetime <= std::chrono::seconds::zero() ||
        config_.tokenLifetime > headroom) {
        return AuthResult<std::string>::err(AuthError(
            ErrorCode::InvalidArgument, "token lifetime must be positive and representable"));
    }

    NewRememberMeRecord record;
    record.userId = userId;
    record.issuedAt = issuedAt;
    record.expiresAt = issuedAt + config_.tokenLifetime;

    auto rawToken = crypto::generateToken();
    record.tokenHash = crypto::hash(rawToken);
    record.userAgent = request.header("User-Agent");
    record.ipAddress = clientAddress(request);
    if (deviceName && !deviceName->empty()) {
        record.deviceName = truncateUtf8(std::move(*deviceName), kMaxDeviceNameLength);
    }

    auto digest = record.tokenHash;
    auto inserted = store_->insert(std::move(record));
    if (inserted.hasError()) {
        logEvent(LogLevel::Error,
                 "failed to persist remember-me token: " +
                     std::string(inserted.error().message()),
                 userId, digest);
        return AuthResult<std::string>::err(inserted.error());
    }

    logEvent(LogLevel::Info, "remember-me token issued", userId, digest, inserted.value());
    return AuthResult<std::string>::ok(std::move(rawToken));
}

void RememberMeService::bindCookie(http::IHttpResponse& response,
                                   std::string_view rawToken) const {
    response.setCookie(config_.cookieName, rawToken, config_.cookie, config_.tokenLifetime);
}

void RememberMeService::clearCookie(http::IHttpResponse& response) const {
    response.clearCookie(config_.cookieName, config_.cookie);
}

std::optional<std::string> RememberMeService::tokenFromRequest(
    const http::IHttpRequest& request) const {
    auto token = request.cookie(config_.cookieName);
    if (!token || token->empty()) {
        return std::nullopt;
    }
    return token;
}

// =============================================================================
// Verification
// =============================================================================

TokenState RememberMeService::classify(const RememberMeRecord& record,
                                       TimePoint now,
                                       std::optional<TimePoint> epoch) noexcept {
    if (now > record.expiresAt) {
        return TokenState::Expired;
    }
    if (epoch && record.issuedAt < *epoch) {
        return TokenState::Revoked;
    }
    return TokenState::Active;
}

AuthResult<void> RememberMeService::expire(std::string_view tokenHash) {
    auto result = store_->deleteByHash(tokenHash);
    if (result.hasError()) {
        logEvent(LogLevel::Warning,
                 "failed to delete terminal remember-me token: " +
                     std::string(result.error().message()),
                 std::nullopt, tokenHash);
    }
    return result;
}

AuthResult<std::optional<UserRecord>> RememberMeService::tryVerify(std::string_view rawToken) {
    using VerifyResult = AuthResult<std::optional<UserRecord>>;

    if (rawToken.empty()) {
        return VerifyResult::ok(std::nullopt);
    }

    auto digest = crypto::hash(rawToken);
    auto found = store_->findByHash(digest);
    if (found.hasError()) {
        return VerifyResult::err(found.error());
    }
    if (!found.value()) {
        logEvent(LogLevel::Debug, "unknown remember-me token", std::nullopt, digest);
        return VerifyResult::ok(std::nullopt);
    }
    const auto& record = *found.value();

    auto epoch = store_->revocationEpoch(record.userId);
    if (epoch.hasError()) {
        return VerifyResult::err(epoch.error());
    }

    auto at = now();
    auto state = classify(record, at, epoch.value());
    if (state != TokenState::Active) {
        logEvent(LogLevel::Info,
                 std::string("rejected ") + std::string(tokenStateName(state)) +
                     " remember-me token",
                 record.userId, digest, record.id);
        (void)expire(digest);
        return VerifyResult::ok(std::nullopt);
    }

    auto touched = store_->touchLastUsed(digest, at);
    if (touched.hasError()) {
        logEvent(LogLevel::Warning,
                 "failed to update last-used time: " + std::string(touched.error().message()),
                 record.userId, digest, record.id);
    }

    auto user = users_->findById(record.userId);
    if (user.hasError()) {
        return VerifyResult::err(user.error());
    }
    if (!user.value()) {
        logEvent(LogLevel::Info, "remember-me token refers to a missing user", record.userId,
                 digest, record.id);
        return VerifyResult::ok(std::nullopt);
    }

    logEvent(LogLevel::Debug, "remember-me token verified", record.userId, digest, record.id);
    return VerifyResult::ok(std::move(user.value()));
}

std::optional<UserRecord> RememberMeService::verify(std::string_view rawToken) noexcept {
    try {
        auto result = tryVerify(rawToken);
        if (result.hasError()) {
            LATCHKEY_LOG_WARN(LogCategory::RememberMe,
                "remember-me verification failed, treating as anonymous: " +
                    std::string(result.error().message()));
            return std::nullopt;
        }
        return std::move(result.value());
    } catch (const std::exception& e) {
        LATCHKEY_LOG_ERROR(LogCategory::RememberMe,
            std::string("remember-me verification raised, treating as anonymous: ") + e.what());
        return std::nullopt;
    } catch (...) {
        LATCHKEY_LOG_ERROR(LogCategory::RememberMe,
            "remember-me verification raised a non-standard exception, treating as anonymous");
        return std::nullopt;
    }
}

// =============================================================================
// Revocation
// =============================================================================

AuthResult<void> RememberMeService::revoke(std::string_view rawToken) {
    if (rawToken.empty()) {
        return AuthResult<void>::ok();
    }
    auto digest = crypto::hash(rawToken);
    auto result = store_->deleteByHash(digest);
    if (result.hasError()) {
        logEvent(LogLevel::Error,
                 "failed to revoke remember-me token: " + std::string(result.error().message()),
                 std::nullopt, digest);
        return result;
    }
    logEvent(LogLevel::Info, "remember-me token revoked", std::nullopt, digest);
    return result;
}

AuthResult<void> RememberMeService::revokeAllForUser(UserId userId) {
    auto result = store_->deleteAllForUser(userId, now());
    if (result.hasError()) {
        logEvent(LogLevel::Error,
                 "failed to revoke all remember-me tokens: " +
                     std::string(result.error().message()),
                 userId);
        return result;
    }
    logEvent(LogLevel::Info, "all remember-me tokens revoked", userId);
    return result;
}

AuthResult<void> RememberMeService::revokeTokenById(UserId userId, TokenId tokenId) {
    auto records = store_->listForUser(userId);
    if (records.hasError()) {
        return AuthResult<void>::err(records.error());
    }
    auto epoch = store_->revocationEpoch(userId);
    if (epoch.hasError()) {
        return AuthResult<void>::err(epoch.error());
    }

    auto at = now();
    auto it = std::find_if(records.value().begin(), records.value().end(),
        [&](const RememberMeRecord& r) {
            return r.id == tokenId && classify(r, at, epoch.value()) == TokenState::Active;
        });
    if (it == records.value().end()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::NotFound, "no such remember-me token for this user"));
    }

    auto result = store_->deleteByHash(it->tokenHash);
    if (result.hasError()) {
        return result;
    }
    logEvent(LogLevel::Info, "remember-me token revoked by id", userId, {}, tokenId);
    return result;
}

// =============================================================================
// Management
// =============================================================================

AuthResult<std::vector<ActiveTokenInfo>> RememberMeService::listActiveTokens(
    UserId userId) const {
    auto records = store_->listForUser(userId);
    if (records.hasError()) {
        return AuthResult<std::vector<ActiveTokenInfo>>::err(records.error());
    }
    auto epoch = store_->revocationEpoch(userId);
    if (epoch.hasError()) {
        return AuthResult<std::vector<ActiveTokenInfo>>::err(epoch.error());
    }

    auto at = now();
    std::vector<ActiveTokenInfo> active;
    for (const auto& record : records.value()) {
        if (classify(record, at, epoch.value()) != TokenState::Active) {
            continue;
        }
        ActiveTokenInfo info;
        info.id = record.id;
        info.deviceName = record.deviceName.value_or(config_.defaultDeviceName);
        info.ipAddress = record.ipAddress;
        info.lastUsedAt = record.lastUsedAt;
        info.issuedAt = record.issuedAt;
        info.expiresAt = record.expiresAt;
        active.push_back(std::move(info));
    }

    std::sort(active.begin(), active.end(),
        [](const ActiveTokenInfo& a, const ActiveTokenInfo& b) {
            if (a.lastUsedAt.has_value() != b.lastUsedAt.has_value()) {
                return a.lastUsedAt.has_value();
            }
            if (a.lastUsedAt && *a.lastUsedAt != *b.lastUsedAt) {
                return *a.lastUsedAt > *b.lastUsedAt;
            }
            return a.issuedAt > b.issuedAt;
        });
    return AuthResult<std::vector<ActiveTokenInfo>>::ok(std::move(active));
}

AuthResult<std::size_t> RememberMeService::purgeExpired() {
    auto result = store_->purgeExpired(now());
    if (result.hasError()) {
        LATCHKEY_LOG_ERROR(LogCategory::RememberMe,
            "remember-me purge failed: " + std::string(result.error().message()));
    }
    return result;
}

}  // namespace latchkey::service
