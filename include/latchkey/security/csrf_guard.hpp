#pragma once

/// @file csrf_guard.hpp
/// @brief Anti-forgery token issuance, comparison and request policy.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "latchkey/http/http_types.hpp"

namespace latchkey::security {

/// Request-level CSRF settings.
struct CsrfConfig {
    /// Request header carrying the token; also used to echo it on responses.
    std::string headerName = "x-csrf-token";

    /// Form field consulted when the header is absent.
    std::string formField = "csrfToken";

    /// Paths that skip verification (exact match).
    std::vector<std::string> exemptPaths = {"/health", "/api/health"};
};

/// The part of the host's session the guard reads and writes.
struct SessionState {
    std::optional<std::string> csrfToken;
};

/// Outcome reason of a CSRF check.
enum class CsrfReason : uint8_t {
    Allowed,  ///< Token present and matching
    Exempt,   ///< Safe method or exempt path
    Missing,  ///< No token presented or none bound to the session
    Mismatch  ///< Token presented but different from the session's
};

/// Return the string name for a CSRF reason.
constexpr std::string_view csrfReasonName(CsrfReason reason) {
    switch (reason) {
        case CsrfReason::Allowed:  return "Allowed";
        case CsrfReason::Exempt:   return "Exempt";
        case CsrfReason::Missing:  return "Missing";
        case CsrfReason::Mismatch: return "Mismatch";
    }
    return "Unknown";
}

/// Result of CsrfGuard::check(). Callers map a rejection to HTTP 403.
struct CsrfDecision {
    bool allowed = false;
    CsrfReason reason = CsrfReason::Missing;
};

/// Issues and verifies synchroniser tokens bound to a session.
///
/// Example:
/// @code
///   CsrfGuard guard;
///   guard.ensureToken(session, response);        // on page render
///   auto decision = guard.check(request, session);
///   if (!decision.allowed) {
///       // respond 403
///   }
/// @endcode
class CsrfGuard {
public:
    explicit CsrfGuard(CsrfConfig config = {});

    /// Generate a new token (64 hex chars).
    /// @throws crypto::CryptoException on CSPRNG failure.
    [[nodiscard]] std::string issue() const;

    /// Constant-time comparison. False when either side is empty.
    [[nodiscard]] static bool verify(std::string_view presented,
                                     std::string_view expected) noexcept;

    /// Reuse the session's token or bind a fresh one, and echo it in the
    /// response header.
    std::string ensureToken(SessionState& session, http::IHttpResponse& response) const;

    /// Bind a fresh token to the session (after login or logout).
    std::string regenerate(SessionState& session) const;

    /// Decide whether a request may proceed.
    ///
    /// GET, HEAD and OPTIONS and the exempt paths are allowed without a
    /// token. Otherwise the token is read from the header, falling back
    /// to the form field. Never throws.
    [[nodiscard]] CsrfDecision check(const http::IHttpRequest& request,
                                     const SessionState& session) const noexcept;

    [[nodiscard]] const CsrfConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool isExempt(const http::IHttpRequest& request) const;

    CsrfConfig config_;
};

} // namespace latchkey::security
