/// @file security_config.cpp
/// @brief SecurityConfig::fromConfig implementation.

#include "latchkey/service/security_config.hpp"

#include "latchkey/foundation/auth_logger.hpp"

namespace latchkey::service {

using foundation::AuthError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

AuthResult<SecurityConfig> invalid(std::string message) {
    LATCHKEY_LOG_ERROR(LogCategory::Config, message);
    return AuthResult<SecurityConfig>::err(
        AuthError(ErrorCode::InvalidArgument, std::move(message)));
}

AuthResult<SecurityConfig> propagate(const AuthError& error) {
    LATCHKEY_LOG_ERROR(LogCategory::Config, std::string(error.message()));
    return AuthResult<SecurityConfig>::err(error);
}

} // namespace

AuthResult<SecurityConfig> SecurityConfig::fromConfig(const foundation::ConfigManager& config) {
    SecurityConfig settings;

    auto environment = config.getOr<std::string>("environment", settings.environment);
    if (environment.hasError()) {
        return propagate(environment.error());
    }
    settings.environment = environment.value();

    // -- remember_me ----------------------------------------------------------

    auto cookieName = config.getOr<std::string>("remember_me.cookie_name",
                                                settings.rememberMe.cookieName);
    if (cookieName.hasError()) {
        return propagate(cookieName.error());
    }
    if (cookieName.value().empty()) {
        return invalid("remember_me.cookie_name must not be empty");
    }
    settings.rememberMe.cookieName = cookieName.value();

    auto lifetimeDays = config.getOr<int64_t>("remember_me.lifetime_days", 30);
    if (lifetimeDays.hasError()) {
        return propagate(lifetimeDays.error());
    }
    if (lifetimeDays.value() <= 0) {
        return invalid("remember_me.lifetime_days must be positive");
    }
    if (lifetimeDays.value() > RememberMeConfig::kMaxLifetimeDays) {
        return invalid("remember_me.lifetime_days must not exceed " +
                       std::to_string(RememberMeConfig::kMaxLifetimeDays));
    }
    settings.rememberMe.tokenLifetime = std::chrono::hours(24 * lifetimeDays.value());

    auto secure = config.getOr<bool>("remember_me.secure_cookies", settings.isProduction());
    if (secure.hasError()) {
        return propagate(secure.error());
    }
    settings.rememberMe.cookie.secure = secure.value();

    // -- csrf -----------------------------------------------------------------

    auto headerName = config.getOr<std::string>("csrf.header_name", settings.csrf.headerName);
    if (headerName.hasError()) {
        return propagate(headerName.error());
    }
    settings.csrf.headerName = headerName.value();

    auto formField = config.getOr<std::string>("csrf.form_field", settings.csrf.formField);
    if (formField.hasError()) {
        return propagate(formField.error());
    }
    settings.csrf.formField = formField.value();

    // -- database -------------------------------------------------------------

    auto connection = config.getOr<std::string>("database.connection_string", "");
    if (connection.hasError()) {
        return propagate(connection.error());
    }
    settings.database.connectionString = connection.value();

    auto maxConnections = config.getOr<int64_t>("database.max_connections", 10);
    if (maxConnections.hasError()) {
        return propagate(maxConnections.error());
    }
    if (maxConnections.value() <= 0) {
        return invalid("database.max_connections must be positive");
    }
    settings.database.maxConnections = static_cast<uint32_t>(maxConnections.value());
    if (settings.database.minConnections > settings.database.maxConnections) {
        settings.database.minConnections = settings.database.maxConnections;
    }

    auto timeout = config.getOr<int64_t>("database.connection_timeout_seconds", 30);
    if (timeout.hasError()) {
        return propagate(timeout.error());
    }
    if (timeout.value() <= 0) {
        return invalid("database.connection_timeout_seconds must be positive");
    }
    settings.database.connectionTimeout = std::chrono::seconds(timeout.value());

    LATCHKEY_LOG_INFO(LogCategory::Config,
        "security settings loaded for environment '" + settings.environment + "'");
    return AuthResult<SecurityConfig>::ok(std::move(settings));
}

}  // namespace latchkey::service
