/// @file csrf_guard.cpp
/// @brief CsrfGuard implementation.

#include "latchkey/security/csrf_guard.hpp"

#include <algorithm>
#include <array>
#include <exception>

#include "latchkey/foundation/auth_logger.hpp"
#include "latchkey/security/crypto_primitives.hpp"

namespace latchkey::security {

using foundation::LogCategory;

namespace {

constexpr std::array<std::string_view, 3> kSafeMethods = {"GET", "HEAD", "OPTIONS"};

} // namespace

CsrfGuard::CsrfGuard(CsrfConfig config)
    : config_(std::move(config)) {}

std::string CsrfGuard::issue() const {
    return crypto::generateToken();
}

bool CsrfGuard::verify(std::string_view presented, std::string_view expected) noexcept {
    if (presented.empty() || expected.empty()) {
        return false;
    }
    return crypto::constantTimeEquals(presented, expected);
}

std::string CsrfGuard::ensureToken(SessionState& session, http::IHttpResponse& response) const {
    if (!session.csrfToken || session.csrfToken->empty()) {
        session.csrfToken = issue();
    }
    response.setHeader(config_.headerName, *session.csrfToken);
    return *session.csrfToken;
}

std::string CsrfGuard::regenerate(SessionState& session) const {
    session.csrfToken = issue();
    return *session.csrfToken;
}

bool CsrfGuard::isExempt(const http::IHttpRequest& request) const {
    auto method = request.method();
    if (std::find(kSafeMethods.begin(), kSafeMethods.end(), method) != kSafeMethods.end()) {
        return true;
    }
    auto path = request.path();
    return std::find(config_.exemptPaths.begin(), config_.exemptPaths.end(), path) !=
           config_.exemptPaths.end();
}

CsrfDecision CsrfGuard::check(const http::IHttpRequest& request,
                              const SessionState& session) const noexcept {
    try {
        if (isExempt(request)) {
            return {true, CsrfReason::Exempt};
        }

        auto presented = request.header(config_.headerName);
        if (!presented || presented->empty()) {
            presented = request.formField(config_.formField);
        }

        if (!presented || presented->empty() || !session.csrfToken ||
            session.csrfToken->empty()) {
            LATCHKEY_LOG_WARN(LogCategory::Csrf,
                "CSRF token missing on " + request.method() + " " + request.path());
            return {false, CsrfReason::Missing};
        }

        if (!verify(*presented, *session.csrfToken)) {
            LATCHKEY_LOG_WARN(LogCategory::Csrf,
                "CSRF token mismatch on " + request.method() + " " + request.path());
            return {false, CsrfReason::Mismatch};
        }
        return {true, CsrfReason::Allowed};
    } catch (const std::exception& e) {
        LATCHKEY_LOG_ERROR(LogCategory::Csrf,
            std::string("CSRF check failed, rejecting request: ") + e.what());
        return {false, CsrfReason::Missing};
    }
}

} // namespace latchkey::security
