/// @file user_repository.cpp
/// @brief InMemoryUserRepository implementation.

#include "latchkey/service/user_repository.hpp"

namespace latchkey::service {

AuthResult<std::optional<UserRecord>> InMemoryUserRepository::findById(UserId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return AuthResult<std::optional<UserRecord>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<UserRecord>>::ok(it->second);
}

void InMemoryUserRepository::add(UserRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = record.id;
    users_.insert_or_assign(id, std::move(record));
}

bool InMemoryUserRepository::remove(UserId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.erase(id) > 0;
}

} // namespace latchkey::service
