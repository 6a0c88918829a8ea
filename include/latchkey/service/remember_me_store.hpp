#pragma once

/// @file remember_me_store.hpp
/// @brief Remember-me token persistence interface and in-memory implementation.
///
/// Abstracts token storage so RememberMeService works with any backend
/// (in-memory, SQL database through AuthDatabase, ...).

#include "latchkey/foundation/auth_result.hpp"
#include "latchkey/service/remember_me_types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace latchkey::service {

using foundation::AuthResult;

/// Abstract interface for remember-me token persistence.
///
/// Implementations must be thread-safe when shared across threads; each
/// operation is atomic with respect to the others. Failures are reported
/// as Persistence* errors.
class IRememberMeStore {
public:
    virtual ~IRememberMeStore() = default;

    /// Persist a new record and return its assigned id.
    /// Fails with AlreadyExists when the digest is already stored.
    virtual AuthResult<TokenId> insert(NewRememberMeRecord record) = 0;

    /// Look a record up by token digest.
    [[nodiscard]] virtual AuthResult<std::optional<RememberMeRecord>> findByHash(
        std::string_view tokenHash) const = 0;

    /// Set lastUsedAt on the record with this digest, if any.
    virtual AuthResult<void> touchLastUsed(std::string_view tokenHash, TimePoint at) = 0;

    /// Delete the record with this digest. Deleting a missing record succeeds.
    virtual AuthResult<void> deleteByHash(std::string_view tokenHash) = 0;

    /// Record @p epoch as the user's revocation epoch and delete all of the
    /// user's records. The stored epoch never moves backwards.
    virtual AuthResult<void> deleteAllForUser(UserId userId, TimePoint epoch) = 0;

    /// The user's revocation epoch, if one was ever recorded.
    [[nodiscard]] virtual AuthResult<std::optional<TimePoint>> revocationEpoch(
        UserId userId) const = 0;

    /// All stored records of a user, live or not, in unspecified order.
    [[nodiscard]] virtual AuthResult<std::vector<RememberMeRecord>> listForUser(
        UserId userId) const = 0;

    /// Delete records that expired at or before @p now, or were issued
    /// before their user's revocation epoch. Returns the number removed.
    virtual AuthResult<std::size_t> purgeExpired(TimePoint now) = 0;
};

/// Thread-safe in-memory token store for testing and development.
///
/// Production deployments should use SqlRememberMeStore.
class InMemoryRememberMeStore : public IRememberMeStore {
public:
    AuthResult<TokenId> insert(NewRememberMeRecord record) override;

    [[nodiscard]] AuthResult<std::optional<RememberMeRecord>> findByHash(
        std::string_view tokenHash) const override;

    AuthResult<void> touchLastUsed(std::string_view tokenHash, TimePoint at) override;

    AuthResult<void> deleteByHash(std::string_view tokenHash) override;

    AuthResult<void> deleteAllForUser(UserId userId, TimePoint epoch) override;

    [[nodiscard]] AuthResult<std::optional<TimePoint>> revocationEpoch(
        UserId userId) const override;

    [[nodiscard]] AuthResult<std::vector<RememberMeRecord>> listForUser(
        UserId userId) const override;

    AuthResult<std::size_t> purgeExpired(TimePoint now) override;

    /// Number of stored records.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RememberMeRecord> records_;
    std::unordered_map<UserId, TimePoint> epochs_;
    uint64_t nextId_ = 1;
};

}  // namespace latchkey::service
