#pragma once

/// @file remember_me_service.hpp
/// @brief Persistent-login token lifecycle: issue, verify, revoke, expire.
///
/// A remember-me token is 32 random bytes, hex-encoded, handed to the
/// browser in an HttpOnly cookie. Only its SHA-256 digest is persisted, so
/// a leaked token table cannot be replayed.
///
/// Record state machine:
///   Active -> Expired  (time passes; detected lazily during verify)
///   Active -> Revoked  (logout, log out everywhere, revoke-by-id)
/// Both terminal states verify as absent.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/http/http_types.hpp"
#include "latchkey/service/remember_me_store.hpp"
#include "latchkey/service/remember_me_types.hpp"
#include "latchkey/service/user_repository.hpp"

namespace latchkey::service {

/// Remember-me token service.
///
/// Holds no mutable state of its own; all shared state lives in the
/// store, so one instance may serve concurrent requests.
///
/// Example:
/// @code
///   RememberMeService rememberMe(config, store, users);
///
///   // Login with "remember me" ticked:
///   auto token = rememberMe.create(user.id, request, "Work laptop");
///   if (token.hasValue()) {
///       rememberMe.bindCookie(response, token.value());
///   }
///
///   // Any later request without a session:
///   if (auto raw = rememberMe.tokenFromRequest(request)) {
///       auto user = rememberMe.verify(*raw);
///   }
/// @endcode
class RememberMeService {
public:
    RememberMeService(RememberMeConfig config,
                      std::shared_ptr<IRememberMeStore> store,
                      std::shared_ptr<IUserRepository> users,
                      Clock clock = {});

    // -- Issuance -------------------------------------------------------------

    /// Issue a token for @p userId and persist its digest together with the
    /// request's user agent and client IP.
    ///
    /// @return The raw token (for bindCookie); InvalidArgument for an unset
    ///         user or a lifetime that is not positive or would overflow the
    ///         clock; or the store's Persistence* error. On error no token
    ///         exists anywhere.
    /// @throws crypto::CryptoException if the system CSPRNG fails.
    [[nodiscard]] AuthResult<std::string> create(UserId userId,
                                                 const http::IHttpRequest& request,
                                                 std::optional<std::string> deviceName = {});

    /// Append a Set-Cookie header carrying @p rawToken.
    void bindCookie(http::IHttpResponse& response, std::string_view rawToken) const;

    /// Append a Set-Cookie header that deletes the cookie. Uses the same
    /// attributes as bindCookie().
    void clearCookie(http::IHttpResponse& response) const;

    /// Read the raw token from the request's cookie.
    [[nodiscard]] std::optional<std::string> tokenFromRequest(
        const http::IHttpRequest& request) const;

    // -- Verification ---------------------------------------------------------

    /// Resolve a raw token to its user.
    ///
    /// Absent for an empty, unknown, expired or revoked token, or when the
    /// user no longer exists. Store failures are logged and also yield
    /// absent; this never throws.
    [[nodiscard]] std::optional<UserRecord> verify(std::string_view rawToken) noexcept;

    /// verify() with store failures reported instead of swallowed.
    [[nodiscard]] AuthResult<std::optional<UserRecord>> tryVerify(std::string_view rawToken);

    /// Classify a record at @p now against the user's revocation epoch.
    /// Expiry is checked first; a record issued strictly before the epoch
    /// is Revoked.
    [[nodiscard]] static TokenState classify(const RememberMeRecord& record,
                                             TimePoint now,
                                             std::optional<TimePoint> epoch) noexcept;

    /// Delete a record found to be terminal. Idempotent.
    AuthResult<void> expire(std::string_view tokenHash);

    // -- Revocation -----------------------------------------------------------

    /// Revoke one token (logout). Unknown or empty tokens succeed.
    AuthResult<void> revoke(std::string_view rawToken);

    /// Revoke every token of a user (log out on all devices). Tokens issued
    /// before this call never verify again, even if their insert is still
    /// in flight; tokens issued afterwards are unaffected.
    AuthResult<void> revokeAllForUser(UserId userId);

    /// Revoke one of the user's devices by record id.
    /// @return NotFound when the id is not a live token of this user.
    AuthResult<void> revokeTokenById(UserId userId, TokenId tokenId);

    // -- Management -----------------------------------------------------------

    /// The user's live tokens, most recently used first (never-used last).
    [[nodiscard]] AuthResult<std::vector<ActiveTokenInfo>> listActiveTokens(UserId userId) const;

    /// Remove expired and epoch-revoked records. Meant for an external
    /// batch job; the library never schedules it.
    AuthResult<std::size_t> purgeExpired();

    [[nodiscard]] const RememberMeConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] TimePoint now() const;

    /// Client address: first X-Forwarded-For entry, else the peer address,
    /// else "unknown". A candidate that is not address-shaped or is longer
    /// than kMaxIpAddressLength is skipped.
    [[nodiscard]] static std::string clientAddress(const http::IHttpRequest& request);

    RememberMeConfig config_;
    std::shared_ptr<IRememberMeStore> store_;
    std::shared_ptr<IUserRepository> users_;
    Clock clock_;
};

}  // namespace latchkey::service
