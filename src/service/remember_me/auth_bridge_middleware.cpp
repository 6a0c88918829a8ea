/// @file auth_bridge_middleware.cpp
/// @brief AuthBridgeMiddleware implementation.

#include "latchkey/service/auth_bridge_middleware.hpp"

#include <exception>
#include <stdexcept>

#include "latchkey/foundation/auth_logger.hpp"

namespace latchkey::service {

using foundation::AuthLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

AuthBridgeMiddleware::AuthBridgeMiddleware(std::shared_ptr<RememberMeService> rememberMe)
    : rememberMe_(std::move(rememberMe)) {
    if (!rememberMe_) {
        throw std::invalid_argument("AuthBridgeMiddleware requires a RememberMeService");
    }
}

void AuthBridgeMiddleware::handle(http::IHttpRequest& request,
                                  http::IHttpResponse& /*response*/,
                                  const Next& next) const {
    bridge(request);
    if (next) {
        next();
    }
}

void AuthBridgeMiddleware::bridge(http::IHttpRequest& request) const noexcept {
    try {
        if (request.sessionUser()) {
            return;
        }
        auto token = rememberMe_->tokenFromRequest(request);
        if (!token) {
            return;
        }

        auto user = rememberMe_->verify(*token);
        if (!user) {
            LATCHKEY_LOG_DEBUG(LogCategory::Middleware,
                "remember-me cookie did not verify; continuing anonymously");
            return;
        }

        auto& logger = AuthLogger::instance();
        if (logger.isEnabled(LogLevel::Info, LogCategory::Middleware)) {
            LogContext ctx;
            ctx.userId = user->id;
            ctx.ipAddress = request.remoteAddress();
            logger.logWithContext(LogLevel::Info, LogCategory::Middleware,
                                  "user restored from remember-me cookie", ctx);
        }
        request.setRememberMeUser(std::move(*user));
    } catch (const std::exception& e) {
        LATCHKEY_LOG_ERROR(LogCategory::Middleware,
            std::string("remember-me bridge failed; continuing anonymously: ") + e.what());
    } catch (...) {
        LATCHKEY_LOG_ERROR(LogCategory::Middleware,
            "remember-me bridge raised a non-standard exception; continuing anonymously");
    }
}

}  // namespace latchkey::service
