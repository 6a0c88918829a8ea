/// @file sql_remember_me_store.cpp
/// @brief SqlRememberMeStore implementation over AuthDatabase.

#include "latchkey/service/sql_remember_me_store.hpp"

#include "latchkey/foundation/auth_logger.hpp"

namespace latchkey::service {

using foundation::AuthError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::PreparedStatement;

namespace {

constexpr std::string_view kSelectColumns =
    "SELECT id, user_id, token_hash, user_agent, ip_address, device_name,"
    " issued_at, expires_at, last_used_at FROM remember_me_tokens";

std::int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

/// Fold database-level failures into the store's persistence codes.
AuthError toStoreError(const AuthError& error, ErrorCode failure) {
    switch (error.code()) {
        case ErrorCode::QueryFailed:
        case ErrorCode::TransactionFailed:
            return AuthError(failure, std::string(error.message()));
        case ErrorCode::ConnectionPoolExhausted:
            return AuthError(ErrorCode::PersistenceTimeout, std::string(error.message()));
        default:
            return AuthError(error.code(), std::string(error.message()));
    }
}

std::optional<RememberMeRecord> toRecord(const foundation::DbRow& row) {
    auto id = foundation::columnInt(row, "id");
    auto userId = foundation::columnInt(row, "user_id");
    auto tokenHash = foundation::columnString(row, "token_hash");
    auto issuedAt = foundation::columnInt(row, "issued_at");
    auto expiresAt = foundation::columnInt(row, "expires_at");
    if (!id || !userId || !tokenHash || !issuedAt || !expiresAt) {
        return std::nullopt;
    }

    RememberMeRecord record;
    record.id = TokenId(static_cast<uint64_t>(*id));
    record.userId = UserId(static_cast<uint64_t>(*userId));
    record.tokenHash = std::move(*tokenHash);
    record.issuedAt = fromMillis(*issuedAt);
    record.expiresAt = fromMillis(*expiresAt);
    if (auto lastUsed = foundation::columnInt(row, "last_used_at")) {
        record.lastUsedAt = fromMillis(*lastUsed);
    }
    record.userAgent = foundation::columnString(row, "user_agent");
    record.ipAddress = foundation::columnString(row, "ip_address");
    record.deviceName = foundation::columnString(row, "device_name");
    return record;
}

AuthError malformedRow() {
    return AuthError(ErrorCode::PersistenceReadFailed, "malformed remember_me_tokens row");
}

} // namespace

SqlRememberMeStore::SqlRememberMeStore(std::shared_ptr<foundation::AuthDatabase> db)
    : db_(std::move(db)) {}

AuthResult<void> SqlRememberMeStore::createSchema() {
    auto result = db_->execute(PreparedStatement(std::string(kSchema)));
    if (result.hasError()) {
        LATCHKEY_LOG_ERROR(LogCategory::Store,
            "schema creation failed: " + std::string(result.error().message()));
        return AuthResult<void>::err(
            toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
    }
    return AuthResult<void>::ok();
}

AuthResult<TokenId> SqlRememberMeStore::insert(NewRememberMeRecord record) {
    PreparedStatement stmt(
        "INSERT INTO remember_me_tokens"
        " (user_id, token_hash, user_agent, ip_address, device_name, issued_at, expires_at)"
        " VALUES ($user_id, $token_hash, $user_agent, $ip_address, $device_name,"
        " $issued_at, $expires_at) RETURNING id");
    stmt.bindInt("user_id", static_cast<std::int64_t>(record.userId.value()))
        .bindString("token_hash", record.tokenHash)
        .bindOptional("user_agent", record.userAgent)
        .bindOptional("ip_address", record.ipAddress)
        .bindOptional("device_name", record.deviceName)
        .bindInt("issued_at", toMillis(record.issuedAt))
        .bindInt("expires_at", toMillis(record.expiresAt));

    auto result = db_->query(stmt);
    if (result.hasError()) {
        return AuthResult<TokenId>::err(
            toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
    }
    if (result.value().empty()) {
        return AuthResult<TokenId>::err(
            AuthError(ErrorCode::PersistenceWriteFailed, "insert returned no id"));
    }
    auto id = foundation::columnInt(result.value().front(), "id");
    if (!id) {
        return AuthResult<TokenId>::err(
            AuthError(ErrorCode::PersistenceWriteFailed, "insert returned no id"));
    }
    return AuthResult<TokenId>::ok(TokenId(static_cast<uint64_t>(*id)));
}

AuthResult<std::optional<RememberMeRecord>> SqlRememberMeStore::findByHash(
    std::string_view tokenHash) const {
    PreparedStatement stmt(std::string(kSelectColumns) + " WHERE token_hash = $token_hash");
    stmt.bindString("token_hash", std::string(tokenHash));

    auto result = db_->query(stmt);
    if (result.hasError()) {
        return AuthResult<std::optional<RememberMeRecord>>::err(
            toStoreError(result.error(), ErrorCode::PersistenceReadFailed));
    }
    if (result.value().empty()) {
        return AuthResult<std::optional<RememberMeRecord>>::ok(std::nullopt);
    }
    auto record = toRecord(result.value().front());
    if (!record) {
        return AuthResult<std::optional<RememberMeRecord>>::err(malformedRow());
    }
    return AuthResult<std::optional<RememberMeRecord>>::ok(std::move(record));
}

AuthResult<void> SqlRememberMeStore::touchLastUsed(std::string_view tokenHash, TimePoint at) {
    PreparedStatement stmt(
        "UPDATE remember_me_tokens SET last_used_at = $at WHERE token_hash = $token_hash");
    stmt.bindInt("at", toMillis(at)).bindString("token_hash", std::string(tokenHash));

    auto result = db_->execute(stmt);
    if (result.hasError()) {
        return AuthResult<void>::err(
            toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
    }
    return AuthResult<void>::ok();
}

AuthResult<void> SqlRememberMeStore::deleteByHash(std::string_view tokenHash) {
    PreparedStatement stmt("DELETE FROM remember_me_tokens WHERE token_hash = $token_hash");
    stmt.bindString("token_hash", std::string(tokenHash));

    auto result = db_->execute(stmt);
    if (result.hasError()) {
        return AuthResult<void>::err(
            toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
    }
    return AuthResult<void>::ok();
}

AuthResult<void> SqlRememberMeStore::deleteAllForUser(UserId userId, TimePoint epoch) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return AuthResult<void>::err(
            toStoreError(txn.error(), ErrorCode::PersistenceWriteFailed));
    }

    auto user = static_cast<std::int64_t>(userId.value());

    PreparedStatement recordEpoch(
        "INSERT INTO remember_me_revocations (user_id, revoked_before)"
        " VALUES ($user_id, $epoch)"
        " ON CONFLICT (user_id) DO UPDATE SET revoked_before ="
        " GREATEST(remember_me_revocations.revoked_before, EXCLUDED.revoked_before)");
    recordEpoch.bindInt("user_id", user).bindInt("epoch", toMillis(epoch));

    PreparedStatement deleteRows("DELETE FROM remember_me_tokens WHERE user_id = $user_id");
    deleteRows.bindInt("user_id", user);

    for (const auto* stmt : {&recordEpoch, &deleteRows}) {
        auto result = txn.value().execute(*stmt);
        if (result.hasError()) {
            // The guard rolls back when it goes out of scope.
            return AuthResult<void>::err(
                toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
        }
    }

    auto committed = txn.value().commit();
    if (committed.hasError()) {
        return AuthResult<void>::err(
            toStoreError(committed.error(), ErrorCode::PersistenceWriteFailed));
    }
    return AuthResult<void>::ok();
}

AuthResult<std::optional<TimePoint>> SqlRememberMeStore::revocationEpoch(UserId userId) const {
    PreparedStatement stmt(
        "SELECT revoked_before FROM remember_me_revocations WHERE user_id = $user_id");
    stmt.bindInt("user_id", static_cast<std::int64_t>(userId.value()));

    auto result = db_->query(stmt);
    if (result.hasError()) {
        return AuthResult<std::optional<TimePoint>>::err(
            toStoreError(result.error(), ErrorCode::PersistenceReadFailed));
    }
    if (result.value().empty()) {
        return AuthResult<std::optional<TimePoint>>::ok(std::nullopt);
    }
    auto epoch = foundation::columnInt(result.value().front(), "revoked_before");
    if (!epoch) {
        return AuthResult<std::optional<TimePoint>>::err(
            AuthError(ErrorCode::PersistenceReadFailed, "malformed remember_me_revocations row"));
    }
    return AuthResult<std::optional<TimePoint>>::ok(fromMillis(*epoch));
}

AuthResult<std::vector<RememberMeRecord>> SqlRememberMeStore::listForUser(UserId userId) const {
    PreparedStatement stmt(std::string(kSelectColumns) + " WHERE user_id = $user_id");
    stmt.bindInt("user_id", static_cast<std::int64_t>(userId.value()));

    auto result = db_->query(stmt);
    if (result.hasError()) {
        return AuthResult<std::vector<RememberMeRecord>>::err(
            toStoreError(result.error(), ErrorCode::PersistenceReadFailed));
    }

    std::vector<RememberMeRecord> records;
    records.reserve(result.value().size());
    for (const auto& row : result.value()) {
        auto record = toRecord(row);
        if (!record) {
            return AuthResult<std::vector<RememberMeRecord>>::err(malformedRow());
        }
        records.push_back(std::move(*record));
    }
    return AuthResult<std::vector<RememberMeRecord>>::ok(std::move(records));
}

AuthResult<std::size_t> SqlRememberMeStore::purgeExpired(TimePoint now) {
    PreparedStatement stmt(
        "DELETE FROM remember_me_tokens t WHERE t.expires_at < $now"
        " OR EXISTS (SELECT 1 FROM remember_me_revocations r"
        " WHERE r.user_id = t.user_id AND t.issued_at < r.revoked_before)"
        " RETURNING t.id");
    stmt.bindInt("now", toMillis(now));

    auto result = db_->query(stmt);
    if (result.hasError()) {
        return AuthResult<std::size_t>::err(
            toStoreError(result.error(), ErrorCode::PersistenceWriteFailed));
    }
    LATCHKEY_LOG_INFO(LogCategory::Store,
        "purged " + std::to_string(result.value().size()) + " remember-me token(s)");
    return AuthResult<std::size_t>::ok(result.value().size());
}

} // namespace latchkey::service
