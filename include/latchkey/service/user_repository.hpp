#pragma once

/// @file user_repository.hpp
/// @brief User lookup interface and in-memory implementation.
///
/// The host application owns its user accounts; the library only needs to
/// turn a verified token's user id back into a user record.

#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/foundation/types.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace latchkey::service {

using foundation::AuthResult;
using foundation::UserId;
using foundation::UserRecord;

/// Abstract interface for user lookup.
///
/// Implementations must be thread-safe when shared across threads.
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /// Find a user by id. An unknown id is a successful empty result.
    [[nodiscard]] virtual AuthResult<std::optional<UserRecord>> findById(UserId id) const = 0;
};

/// Thread-safe in-memory user repository for testing and development.
class InMemoryUserRepository : public IUserRepository {
public:
    [[nodiscard]] AuthResult<std::optional<UserRecord>> findById(UserId id) const override;

    /// Add or replace a user.
    void add(UserRecord record);

    /// Remove a user. Returns false if not found.
    bool remove(UserId id);

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, UserRecord> users_;
};

}  // namespace latchkey::service
