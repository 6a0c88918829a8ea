#pragma once

/// @file latchkey.hpp
/// @brief Aggregate header for the latchkey library.

#include "latchkey/version.hpp"

#include "latchkey/foundation/auth_database.hpp"
#include "latchkey/foundation/auth_logger.hpp"
#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/foundation/config_manager.hpp"
#include "latchkey/foundation/types.hpp"

#include "latchkey/http/http_types.hpp"

#include "latchkey/security/crypto_primitives.hpp"
#include "latchkey/security/csrf_guard.hpp"
#include "latchkey/security/encoding.hpp"

#include "latchkey/service/auth_bridge_middleware.hpp"
#include "latchkey/service/remember_me_service.hpp"
#include "latchkey/service/remember_me_store.hpp"
#include "latchkey/service/security_config.hpp"
#include "latchkey/service/sql_remember_me_store.hpp"
#include "latchkey/service/user_repository.hpp"
