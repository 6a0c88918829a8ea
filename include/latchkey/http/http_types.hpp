#pragma once

/// @file http_types.hpp
/// @brief Minimal HTTP request/response abstraction consumed by the
///        remember-me, CSRF and middleware components.
///
/// The host framework adapts its own request and response objects to
/// IHttpRequest / IHttpResponse. HttpRequest and HttpResponse are plain
/// value implementations for tests and simple hosts.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "latchkey/foundation/types.hpp"

namespace latchkey::http {

using foundation::UserId;
using foundation::UserRecord;

// ── Cookies ─────────────────────────────────────────────────────────────────

/// SameSite cookie attribute values.
enum class SameSite : uint8_t {
    Strict,
    Lax,
    None
};

/// Return the attribute spelling for a SameSite value.
constexpr std::string_view sameSiteName(SameSite value) {
    switch (value) {
        case SameSite::Strict: return "Strict";
        case SameSite::Lax:    return "Lax";
        case SameSite::None:   return "None";
    }
    return "Strict";
}

/// Attributes shared by a cookie's Set-Cookie and its clearing counterpart.
///
/// Browsers only delete a cookie when the clearing header repeats the
/// Path and Domain it was set with, so one instance serves both.
struct CookieAttributes {
    std::string path = "/";
    std::optional<std::string> domain;
    bool httpOnly = true;
    bool secure = true;
    SameSite sameSite = SameSite::Strict;
};

/// Build a Set-Cookie header value that stores @p value for @p maxAge.
///
/// Example: `remember_me_token=ab12...; Path=/; Max-Age=2592000; HttpOnly;
/// Secure; SameSite=Strict`
[[nodiscard]] std::string serializeSetCookie(std::string_view name, std::string_view value,
                                             const CookieAttributes& attributes,
                                             std::chrono::seconds maxAge);

/// Build a Set-Cookie header value that expires @p name immediately
/// (empty value, Max-Age=0 and an Expires date at the Unix epoch).
[[nodiscard]] std::string serializeClearCookie(std::string_view name,
                                               const CookieAttributes& attributes);

/// Parse a Cookie request header ("a=1; b=2") into name/value pairs.
/// Malformed pairs are skipped; the first occurrence of a name wins.
[[nodiscard]] std::map<std::string, std::string> parseCookieHeader(std::string_view header);

/// Format a time point as an IMF-fixdate ("Thu, 01 Jan 1970 00:00:00 GMT").
[[nodiscard]] std::string formatHttpDate(std::chrono::system_clock::time_point tp);

/// Lowercase an ASCII header name.
[[nodiscard]] std::string normalizeHeaderName(std::string_view name);

// ── Interfaces ──────────────────────────────────────────────────────────────

/// Read access to an inbound request plus the two identity slots the
/// authentication layer works with.
class IHttpRequest {
public:
    virtual ~IHttpRequest() = default;

    /// Request method in upper case ("GET", "POST", ...).
    [[nodiscard]] virtual std::string method() const = 0;

    /// Request path without query string.
    [[nodiscard]] virtual std::string path() const = 0;

    /// Header lookup; names compare case-insensitively.
    [[nodiscard]] virtual std::optional<std::string> header(std::string_view name) const = 0;

    /// Cookie lookup by exact name.
    [[nodiscard]] virtual std::optional<std::string> cookie(std::string_view name) const = 0;

    /// Parsed form body field, if the body was a form.
    [[nodiscard]] virtual std::optional<std::string> formField(std::string_view name) const = 0;

    /// Transport-level peer address, if the host knows it.
    [[nodiscard]] virtual std::optional<std::string> remoteAddress() const = 0;

    /// Identity established by the host's session layer, if any.
    [[nodiscard]] virtual std::optional<UserId> sessionUser() const = 0;

    /// Identity restored from a remember-me token during this request.
    [[nodiscard]] virtual std::optional<UserRecord> rememberMeUser() const = 0;

    virtual void setRememberMeUser(UserRecord user) = 0;
};

/// Write access to an outbound response.
class IHttpResponse {
public:
    virtual ~IHttpResponse() = default;

    /// Replace all values of a header.
    virtual void setHeader(std::string_view name, std::string value) = 0;

    /// Add a header value, keeping existing ones (needed for Set-Cookie).
    virtual void appendHeader(std::string_view name, std::string value) = 0;

    /// Append a Set-Cookie header storing a cookie.
    void setCookie(std::string_view name, std::string_view value,
                   const CookieAttributes& attributes, std::chrono::seconds maxAge) {
        appendHeader("Set-Cookie", serializeSetCookie(name, value, attributes, maxAge));
    }

    /// Append a Set-Cookie header deleting a cookie.
    void clearCookie(std::string_view name, const CookieAttributes& attributes) {
        appendHeader("Set-Cookie", serializeClearCookie(name, attributes));
    }
};

// ── Value implementations ───────────────────────────────────────────────────

/// In-memory request.
///
/// Example:
/// @code
///   HttpRequest req;
///   req.setMethod("POST")
///      .setPath("/login")
///      .setHeader("User-Agent", "Mozilla/5.0")
///      .setRemoteAddress("203.0.113.7");
/// @endcode
class HttpRequest : public IHttpRequest {
public:
    HttpRequest() = default;

    HttpRequest& setMethod(std::string method);
    HttpRequest& setPath(std::string path);
    HttpRequest& setHeader(std::string_view name, std::string value);

    /// Add one cookie to the Cookie header.
    HttpRequest& addCookie(std::string_view name, std::string_view value);

    HttpRequest& setFormField(std::string name, std::string value);
    HttpRequest& setRemoteAddress(std::string address);
    HttpRequest& setSessionUser(std::optional<UserId> user);

    [[nodiscard]] std::string method() const override;
    [[nodiscard]] std::string path() const override;
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const override;
    [[nodiscard]] std::optional<std::string> cookie(std::string_view name) const override;
    [[nodiscard]] std::optional<std::string> formField(std::string_view name) const override;
    [[nodiscard]] std::optional<std::string> remoteAddress() const override;
    [[nodiscard]] std::optional<UserId> sessionUser() const override;
    [[nodiscard]] std::optional<UserRecord> rememberMeUser() const override;
    void setRememberMeUser(UserRecord user) override;

private:
    std::string method_ = "GET";
    std::string path_ = "/";
    std::map<std::string, std::string, std::less<>> headers_;
    std::map<std::string, std::string, std::less<>> form_;
    std::optional<std::string> remoteAddress_;
    std::optional<UserId> sessionUser_;
    std::optional<UserRecord> rememberMeUser_;
};

/// In-memory response collecting headers.
class HttpResponse : public IHttpResponse {
public:
    void setHeader(std::string_view name, std::string value) override;
    void appendHeader(std::string_view name, std::string value) override;

    /// First value of a header, if present.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    /// All values of a header in insertion order.
    [[nodiscard]] std::vector<std::string> headerValues(std::string_view name) const;

    /// Shorthand for headerValues("Set-Cookie").
    [[nodiscard]] std::vector<std::string> setCookies() const;

private:
    std::map<std::string, std::vector<std::string>, std::less<>> headers_;
};

} // namespace latchkey::http
