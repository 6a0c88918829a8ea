#pragma once

/// @file sql_remember_me_store.hpp
/// @brief IRememberMeStore backed by a relational database through AuthDatabase.

#include <memory>
#include <string_view>

#include "latchkey/foundation/auth_database.hpp"
#include "latchkey/service/remember_me_store.hpp"

namespace latchkey::service {

/// SQL token store.
///
/// Timestamps are stored as BIGINT milliseconds since the Unix epoch.
/// Statements target PostgreSQL (RETURNING, ON CONFLICT). Every operation
/// is a single statement except deleteAllForUser(), which writes the epoch
/// and deletes the rows in one transaction.
///
/// Error mapping: failed reads give PersistenceReadFailed, failed writes
/// give PersistenceWriteFailed, a pool wait past the configured timeout
/// gives PersistenceTimeout, and an unconnected database gives NotConnected.
class SqlRememberMeStore : public IRememberMeStore {
public:
    /// DDL for the two tables the store uses.
    static constexpr std::string_view kSchema =
        "CREATE TABLE IF NOT EXISTS remember_me_tokens ("
        " id BIGSERIAL PRIMARY KEY,"
        " user_id BIGINT NOT NULL,"
        " token_hash VARCHAR(256) NOT NULL UNIQUE,"
        " user_agent TEXT,"
        " ip_address VARCHAR(45),"
        " device_name VARCHAR(200),"
        " issued_at BIGINT NOT NULL,"
        " expires_at BIGINT NOT NULL,"
        " last_used_at BIGINT"
        ");"
        "CREATE INDEX IF NOT EXISTS remember_me_tokens_user_idx"
        " ON remember_me_tokens (user_id);"
        "CREATE TABLE IF NOT EXISTS remember_me_revocations ("
        " user_id BIGINT PRIMARY KEY,"
        " revoked_before BIGINT NOT NULL"
        ");";

    explicit SqlRememberMeStore(std::shared_ptr<foundation::AuthDatabase> db);

    /// Create the tables if they do not exist.
    AuthResult<void> createSchema();

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

private:
    std::shared_ptr<foundation::AuthDatabase> db_;
};

}  // namespace latchkey::service
