#pragma once

/// @file remember_me_types.hpp
/// @brief Records, settings and state used by the remember-me service.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "latchkey/foundation/types.hpp"
#include "latchkey/http/http_types.hpp"

namespace latchkey::service {

using foundation::TokenId;
using foundation::UserId;
using foundation::UserRecord;

using TimePoint = std::chrono::system_clock::time_point;

/// Time source; injectable so tests can move time forward.
using Clock = std::function<TimePoint()>;

// -- Persisted records --------------------------------------------------------

/// A persisted remember-me token.
///
/// Only the SHA-256 digest of the raw token is stored. The raw value
/// exists only in the issuing call, the outbound cookie and inbound
/// requests.
struct RememberMeRecord {
    TokenId id;                              ///< Store-assigned.
    UserId userId;
    std::string tokenHash;                   ///< 64 lowercase hex chars.
    TimePoint issuedAt{};
    TimePoint expiresAt{};                   ///< Always after issuedAt.
    std::optional<TimePoint> lastUsedAt;
    std::optional<std::string> deviceName;
    std::optional<std::string> userAgent;
    std::optional<std::string> ipAddress;
};

/// Column limits for the provenance fields. Values longer than these are
/// never handed to a store.
inline constexpr std::size_t kMaxIpAddressLength = 45;    ///< bytes
inline constexpr std::size_t kMaxDeviceNameLength = 200;  ///< UTF-8 code points

/// Fields supplied when inserting a record; the store assigns the id.
struct NewRememberMeRecord {
    UserId userId;
    std::string tokenHash;
    TimePoint issuedAt{};
    TimePoint expiresAt{};
    std::optional<std::string> deviceName;
    std::optional<std::string> userAgent;
    std::optional<std::string> ipAddress;
};

/// Sanitised view of a live token for a "manage your devices" listing.
/// Never carries the digest.
struct ActiveTokenInfo {
    TokenId id;
    std::string deviceName;
    std::optional<std::string> ipAddress;
    std::optional<TimePoint> lastUsedAt;
    TimePoint issuedAt{};
    TimePoint expiresAt{};
};

// -- Lifecycle ----------------------------------------------------------------

/// Lifecycle state of a record. Expired and Revoked are terminal.
enum class TokenState : uint8_t {
    Active,
    Expired,  ///< now > expiresAt
    Revoked   ///< issued before the user's revocation epoch
};

/// Return the string name for a token state.
constexpr std::string_view tokenStateName(TokenState state) {
    switch (state) {
        case TokenState::Active:  return "Active";
        case TokenState::Expired: return "Expired";
        case TokenState::Revoked: return "Revoked";
    }
    return "Unknown";
}

// -- Configuration ------------------------------------------------------------

/// Settings for the remember-me service.
struct RememberMeConfig {
    /// Longest accepted token lifetime, in days.
    static constexpr int64_t kMaxLifetimeDays = 3650;

    /// Cookie carrying the raw token.
    std::string cookieName = "remember_me_token";

    /// Token lifetime; also the cookie Max-Age.
    std::chrono::seconds tokenLifetime{30 * 24 * 60 * 60};  // 30 days

    /// Attributes used for both setting and clearing the cookie.
    http::CookieAttributes cookie{};

    /// Label used in device listings when none was captured at login.
    std::string defaultDeviceName = "Unknown Device";
};

}  // namespace latchkey::service
