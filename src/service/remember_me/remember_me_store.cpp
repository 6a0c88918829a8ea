/// @file remember_me_store.cpp
/// @brief InMemoryRememberMeStore implementation.

#include "latchkey/service/remember_me_store.hpp"

namespace latchkey::service {

using foundation::AuthError;
using foundation::ErrorCode;

AuthResult<TokenId> InMemoryRememberMeStore::insert(NewRememberMeRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.tokenHash) > 0) {
        return AuthResult<TokenId>::err(
            AuthError(ErrorCode::AlreadyExists, "token digest already stored"));
    }

    TokenId id(nextId_++);
    RememberMeRecord stored;
    stored.id = id;
    stored.userId = record.userId;
    stored.tokenHash = record.tokenHash;
    stored.issuedAt = record.issuedAt;
    stored.expiresAt = record.expiresAt;
    stored.deviceName = std::move(record.deviceName);
    stored.userAgent = std::move(record.userAgent);
    stored.ipAddress = std::move(record.ipAddress);

    records_.emplace(std::move(record.tokenHash), std::move(stored));
    return AuthResult<TokenId>::ok(id);
}

AuthResult<std::optional<RememberMeRecord>> InMemoryRememberMeStore::findByHash(
    std::string_view tokenHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(tokenHash));
    if (it == records_.end()) {
        return AuthResult<std::optional<RememberMeRecord>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<RememberMeRecord>>::ok(it->second);
}

AuthResult<void> InMemoryRememberMeStore::touchLastUsed(std::string_view tokenHash,
                                                        TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(tokenHash));
    if (it != records_.end()) {
        it->second.lastUsedAt = at;
    }
    return AuthResult<void>::ok();
}

AuthResult<void> InMemoryRememberMeStore::deleteByHash(std::string_view tokenHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(std::string(tokenHash));
    return AuthResult<void>::ok();
}

AuthResult<void> InMemoryRememberMeStore::deleteAllForUser(UserId userId, TimePoint epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = epochs_.emplace(userId, epoch);
    if (!inserted && it->second < epoch) {
        it->second = epoch;
    }
    for (auto rec = records_.begin(); rec != records_.end();) {
        if (rec->second.userId == userId) {
            rec = records_.erase(rec);
        } else {
            ++rec;
        }
    }
    return AuthResult<void>::ok();
}

AuthResult<std::optional<TimePoint>> InMemoryRememberMeStore::revocationEpoch(
    UserId userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = epochs_.find(userId);
    if (it == epochs_.end()) {
        return AuthResult<std::optional<TimePoint>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<TimePoint>>::ok(it->second);
}

AuthResult<std::vector<RememberMeRecord>> InMemoryRememberMeStore::listForUser(
    UserId userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RememberMeRecord> result;
    for (const auto& [hash, record] : records_) {
        if (record.userId == userId) {
            result.push_back(record);
        }
    }
    return AuthResult<std::vector<RememberMeRecord>>::ok(std::move(result));
}

AuthResult<std::size_t> InMemoryRememberMeStore::purgeExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        auto epoch = epochs_.find(it->second.userId);
        bool revoked = epoch != epochs_.end() && it->second.issuedAt < epoch->second;
        if (it->second.expiresAt < now || revoked) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return AuthResult<std::size_t>::ok(removed);
}

std::size_t InMemoryRememberMeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace latchkey::service
