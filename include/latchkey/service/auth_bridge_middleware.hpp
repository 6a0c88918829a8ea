#pragma once

/// @file auth_bridge_middleware.hpp
/// @brief Request-time bridge from a remember-me cookie to a user identity.

#include <functional>
#include <memory>

#include "latchkey/http/http_types.hpp"
#include "latchkey/service/remember_me_service.hpp"

namespace latchkey::service {

/// Middleware that restores the user of a remember-me cookie.
///
/// When a request carries the cookie and has no session identity, the
/// token is verified and the user is attached with setRememberMeUser().
/// A session identity is never overwritten, the request is never
/// terminated, and next() runs exactly once whatever happens.
class AuthBridgeMiddleware {
public:
    /// Continuation invoked after the bridge has run.
    using Next = std::function<void()>;

    /// @throws std::invalid_argument if @p rememberMe is null.
    explicit AuthBridgeMiddleware(std::shared_ptr<RememberMeService> rememberMe);

    void handle(http::IHttpRequest& request, http::IHttpResponse& response,
                const Next& next) const;

private:
    /// Attach the remember-me user if applicable. Never throws.
    void bridge(http::IHttpRequest& request) const noexcept;

    std::shared_ptr<RememberMeService> rememberMe_;
};

}  // namespace latchkey::service
