/// @file auth_database.cpp
/// @brief AuthDatabase implementation wrapping kcenon database_system.

#include "latchkey/foundation/auth_database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <functional>
#include <mutex>

#include "latchkey/foundation/auth_logger.hpp"

namespace latchkey::foundation {

namespace {

::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::postgres;
}

QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::string quoteLiteral(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (char c : value) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string toSqlLiteral(const DbValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quoteLiteral(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "TRUE" : "FALSE";
        } else {
            return std::to_string(arg);
        }
    }, value);
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

AuthError notConnected() {
    return AuthError(ErrorCode::NotConnected, "not connected to database");
}

AuthError poolExhausted() {
    return AuthError(ErrorCode::ConnectionPoolExhausted,
                     "no connection available within timeout");
}

} // namespace

// ---------------------------------------------------------------------------
// Column accessors
// ---------------------------------------------------------------------------

std::optional<std::int64_t> columnInt(const DbRow& row, std::string_view column) {
    auto it = row.find(std::string(column));
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&it->second)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&it->second)) {
        return static_cast<std::int64_t>(*d);
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        std::int64_t parsed = 0;
        auto [end, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec == std::errc{} && end == s->data() + s->size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<std::string> columnString(const DbRow& row, std::string_view column) {
    auto it = row.find(std::string(column));
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindBool(std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

PreparedStatement& PreparedStatement::bindOptional(
    std::string_view name, const std::optional<std::string>& value) {
    return value ? bindString(name, *value) : bindNull(name);
}

PreparedStatement& PreparedStatement::bindOptional(
    std::string_view name, const std::optional<std::int64_t>& value) {
    return value ? bindInt(name, *value) : bindNull(name);
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

std::string PreparedStatement::resolve() const {
    // Single left-to-right pass so a substituted value is never rescanned
    // for placeholders.
    std::string resolved;
    resolved.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            resolved += sql_[pos++];
            continue;
        }
        auto end = pos + 1;
        while (end < sql_.size() && isIdentifierChar(sql_[end])) {
            ++end;
        }
        auto it = params_.find(sql_.substr(pos + 1, end - pos - 1));
        if (end == pos + 1 || it == params_.end()) {
            resolved.append(sql_, pos, end - pos);
        } else {
            resolved += toSqlLiteral(it->second);
        }
        pos = end;
    }
    return resolved;
}

void PreparedStatement::clearBindings() {
    params_.clear();
}

// ---------------------------------------------------------------------------
// Connection pool entry
// ---------------------------------------------------------------------------

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    std::shared_ptr<::database::database_manager> manager;
    std::function<void(::database::database_manager*)> release;
    bool active = true;

    void finish() {
        if (active) {
            (void)manager->rollback_transaction();
            active = false;
        }
        if (release) {
            release(manager.get());
            release = nullptr;
        }
    }
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    if (impl_) {
        impl_->finish();
    }
}

Transaction::Transaction(Transaction&&) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            impl_->finish();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

AuthResult<void> Transaction::commit() {
    if (!isActive()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    auto result = impl_->manager->commit_transaction();
    impl_->active = false;
    if (!result.is_ok()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TransactionFailed,
                      "commit failed: " + result.error().message));
    }
    return AuthResult<void>::ok();
}

AuthResult<void> Transaction::rollback() {
    if (!isActive()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    auto result = impl_->manager->rollback_transaction();
    impl_->active = false;
    if (!result.is_ok()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TransactionFailed,
                      "rollback failed: " + result.error().message));
    }
    return AuthResult<void>::ok();
}

AuthResult<QueryResult> Transaction::query(const PreparedStatement& stmt) {
    if (!isActive()) {
        return AuthResult<QueryResult>::err(
            AuthError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    auto result = impl_->manager->select_query_result(stmt.resolve());
    if (!result.is_ok()) {
        return AuthResult<QueryResult>::err(
            AuthError(ErrorCode::QueryFailed, result.error().message));
    }
    return AuthResult<QueryResult>::ok(convertResult(result.value()));
}

AuthResult<void> Transaction::execute(const PreparedStatement& stmt) {
    if (!isActive()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    auto result = impl_->manager->execute_query_result(stmt.resolve());
    if (!result.is_ok()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::QueryFailed, result.error().message));
    }
    return AuthResult<void>::ok();
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// AuthDatabase::Impl
// ---------------------------------------------------------------------------

struct AuthDatabase::Impl {
    DatabaseConfig config;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    /// Block until a connection is free, the pool can grow, or the
    /// configured timeout passes (nullptr).
    std::shared_ptr<::database::database_manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            auto idle = std::find_if(pool.begin(), pool.end(),
                [](const PooledConnection& c) { return !c.inUse; });
            if (idle != pool.end()) {
                idle->inUse = true;
                return idle->manager;
            }

            if (pool.size() < config.maxConnections) {
                auto conn = open();
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(::database::database_manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection open() {
        PooledConnection conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<::database::database_manager>(conn.context);

        if (!conn.manager->set_mode(toKcenon(config.dbType))) {
            conn.manager.reset();
            return conn;
        }

        auto result = conn.manager->connect_result(config.connectionString);
        if (!result.is_ok()) {
            LATCHKEY_LOG_WARN(LogCategory::Store,
                "database connection failed: " + result.error().message);
            conn.manager.reset();
        }
        return conn;
    }

    /// Run a callable against a checked-out connection, returning it to
    /// the pool afterwards.
    template <typename T, typename Fn>
    AuthResult<T> withConnection(Fn&& fn) {
        if (!connected.load()) {
            return AuthResult<T>::err(notConnected());
        }
        auto mgr = checkout();
        if (!mgr) {
            return AuthResult<T>::err(poolExhausted());
        }
        auto result = fn(*mgr);
        checkin(mgr.get());
        return result;
    }
};

// ---------------------------------------------------------------------------
// AuthDatabase
// ---------------------------------------------------------------------------

AuthDatabase::AuthDatabase()
    : impl_(std::make_unique<Impl>()) {}

AuthDatabase::~AuthDatabase() {
    if (impl_) {
        disconnect();
    }
}

AuthDatabase::AuthDatabase(AuthDatabase&&) noexcept = default;

AuthDatabase& AuthDatabase::operator=(AuthDatabase&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

AuthResult<void> AuthDatabase::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::AlreadyExists, "already connected"));
    }
    if (config.maxConnections == 0 || config.minConnections > config.maxConnections) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "invalid connection pool bounds"));
    }

    impl_->config = config;

    std::lock_guard lock(impl_->poolMutex);
    for (uint32_t i = 0; i < config.minConnections; ++i) {
        auto conn = impl_->open();
        if (!conn.manager) {
            for (auto& opened : impl_->pool) {
                (void)opened.manager->disconnect_result();
            }
            impl_->pool.clear();
            return AuthResult<void>::err(
                AuthError(ErrorCode::PersistenceError,
                          "failed to open connection " + std::to_string(i + 1) +
                              "/" + std::to_string(config.minConnections)));
        }
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);
    LATCHKEY_LOG_INFO(LogCategory::Store,
        "database pool ready with " + std::to_string(impl_->pool.size()) + " connection(s)");
    return AuthResult<void>::ok();
}

void AuthDatabase::disconnect() {
    impl_->connected.store(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();
    impl_->poolCv.notify_all();
}

bool AuthDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

AuthResult<QueryResult> AuthDatabase::query(const PreparedStatement& stmt) {
    return impl_->withConnection<QueryResult>(
        [&](::database::database_manager& mgr) {
            auto result = mgr.select_query_result(stmt.resolve());
            if (!result.is_ok()) {
                return AuthResult<QueryResult>::err(
                    AuthError(ErrorCode::QueryFailed, result.error().message));
            }
            return AuthResult<QueryResult>::ok(convertResult(result.value()));
        });
}

AuthResult<void> AuthDatabase::execute(const PreparedStatement& stmt) {
    return impl_->withConnection<void>(
        [&](::database::database_manager& mgr) {
            auto result = mgr.execute_query_result(stmt.resolve());
            if (!result.is_ok()) {
                return AuthResult<void>::err(
                    AuthError(ErrorCode::QueryFailed, result.error().message));
            }
            return AuthResult<void>::ok();
        });
}

AuthResult<Transaction> AuthDatabase::beginTransaction() {
    if (!impl_->connected.load()) {
        return AuthResult<Transaction>::err(notConnected());
    }
    auto mgr = impl_->checkout();
    if (!mgr) {
        return AuthResult<Transaction>::err(poolExhausted());
    }

    auto result = mgr->begin_transaction();
    if (!result.is_ok()) {
        impl_->checkin(mgr.get());
        return AuthResult<Transaction>::err(
            AuthError(ErrorCode::TransactionFailed,
                      "failed to begin transaction: " + result.error().message));
    }

    auto txnImpl = std::make_unique<Transaction::Impl>();
    txnImpl->manager = mgr;
    auto* pool = impl_.get();
    txnImpl->release = [pool](::database::database_manager* m) { pool->checkin(m); };

    return AuthResult<Transaction>::ok(Transaction(std::move(txnImpl)));
}

std::size_t AuthDatabase::activeConnections() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return static_cast<std::size_t>(std::count_if(
        impl_->pool.begin(), impl_->pool.end(),
        [](const PooledConnection& c) { return c.inUse; }));
}

std::size_t AuthDatabase::poolSize() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return impl_->pool.size();
}

} // namespace latchkey::foundation
