#pragma once

/// @file security_config.hpp
/// @brief Runtime settings for the remember-me, CSRF and persistence layers,
///        assembled from a ConfigManager.

#include <string>

#include "latchkey/foundation/auth_database.hpp"
#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/foundation/config_manager.hpp"
#include "latchkey/security/csrf_guard.hpp"
#include "latchkey/service/remember_me_types.hpp"

namespace latchkey::service {

using foundation::AuthResult;

/// Aggregated library settings.
///
/// Recognised keys (all optional):
/// | Key                                   | Default                    |
/// |---------------------------------------|----------------------------|
/// | environment                           | development                |
/// | remember_me.cookie_name               | remember_me_token          |
/// | remember_me.lifetime_days             | 30                         |
/// | remember_me.secure_cookies            | environment == production  |
/// | csrf.header_name                      | x-csrf-token               |
/// | csrf.form_field                       | csrfToken                  |
/// | database.connection_string            | (empty)                    |
/// | database.max_connections              | 10                         |
/// | database.connection_timeout_seconds   | 30                         |
struct SecurityConfig {
    std::string environment = "development";
    RememberMeConfig rememberMe;
    security::CsrfConfig csrf;
    foundation::DatabaseConfig database;

    [[nodiscard]] bool isProduction() const noexcept { return environment == "production"; }

    /// Build settings from loaded configuration.
    /// @return The settings, ConfigTypeMismatch for a key of the wrong type,
    ///         or InvalidArgument for an out-of-range value.
    [[nodiscard]] static AuthResult<SecurityConfig> fromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace latchkey::service
