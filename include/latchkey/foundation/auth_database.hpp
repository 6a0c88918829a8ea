#pragma once

/// @file auth_database.hpp
/// @brief AuthDatabase wrapping kcenon database_system for token persistence,
///        with a bounded connection pool and RAII transactions.
///
/// The host owns the AuthDatabase: it calls connect() at start-up,
/// hands the instance to SqlRememberMeStore, and calls disconnect() on
/// shutdown. Nothing in the library opens connections on its own.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "latchkey/foundation/auth_result.hpp"

namespace latchkey::foundation {

// ── Type aliases for database values ────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT (or RETURNING) statement.
using QueryResult = std::vector<DbRow>;

/// Read an integer column. Numeric strings are accepted because some
/// backends return BIGINT columns as text.
[[nodiscard]] std::optional<std::int64_t> columnInt(const DbRow& row, std::string_view column);

/// Read a text column; SQL NULL and missing columns yield nullopt.
[[nodiscard]] std::optional<std::string> columnString(const DbRow& row, std::string_view column);

// ── Database types ──────────────────────────────────────────────────────────

/// Supported database backend types.
enum class DatabaseType : uint8_t {
    PostgreSQL,
    MySQL,
    SQLite
};

/// Connection pool settings.
struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::PostgreSQL;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 10;

    /// Upper bound on waiting for a pooled connection. A store call that
    /// exceeds it fails with ConnectionPoolExhausted.
    std::chrono::seconds connectionTimeout{30};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// A parameterized SQL statement with named parameter binding.
///
/// Parameters are written as $name placeholders and substituted by
/// resolve(). String values are quoted with embedded single quotes doubled,
/// so token digests, user agents and device names never break out of
/// their literal.
///
/// Example:
/// @code
///   PreparedStatement stmt(
///       "DELETE FROM remember_me_tokens WHERE token_hash = $hash");
///   stmt.bindString("hash", digest);
///   auto result = db.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindBool(std::string_view name, bool value);
    PreparedStatement& bindNull(std::string_view name);

    /// Bind a string when present, NULL otherwise.
    PreparedStatement& bindOptional(std::string_view name,
                                    const std::optional<std::string>& value);

    /// Bind a NULL-able integer.
    PreparedStatement& bindOptional(std::string_view name,
                                    const std::optional<std::int64_t>& value);

    /// Get the original SQL template.
    [[nodiscard]] std::string_view sql() const noexcept;

    /// Resolve the SQL template with all bound parameters substituted.
    /// Placeholders without a binding are left untouched.
    [[nodiscard]] std::string resolve() const;

    void clearBindings();

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

// ── Transaction ─────────────────────────────────────────────────────────────

/// RAII transaction guard.
///
/// Rolls back on destruction unless commit() or rollback() was called.
/// Every statement runs on the connection checked out by beginTransaction(),
/// which is returned to the pool when the guard is destroyed.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] AuthResult<void> commit();
    [[nodiscard]] AuthResult<void> rollback();

    /// Run a statement that returns rows within this transaction.
    [[nodiscard]] AuthResult<QueryResult> query(const PreparedStatement& stmt);

    /// Run a command (INSERT/UPDATE/DELETE) within this transaction.
    [[nodiscard]] AuthResult<void> execute(const PreparedStatement& stmt);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class AuthDatabase;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

// ── AuthDatabase ────────────────────────────────────────────────────────────

/// Database client wrapping kcenon's database_system with connection pooling.
///
/// Uses PIMPL to hide all kcenon implementation details. Thread-safe: each
/// call checks a connection out of the pool for its duration.
///
/// Example:
/// @code
///   auto db = std::make_shared<AuthDatabase>();
///   DatabaseConfig config;
///   config.connectionString = "host=localhost dbname=app";
///   if (auto r = db->connect(config); r.hasValue()) {
///       SqlRememberMeStore store(db);
///   }
/// @endcode
class AuthDatabase {
public:
    AuthDatabase();
    ~AuthDatabase();

    AuthDatabase(const AuthDatabase&) = delete;
    AuthDatabase& operator=(const AuthDatabase&) = delete;
    AuthDatabase(AuthDatabase&&) noexcept;
    AuthDatabase& operator=(AuthDatabase&&) noexcept;

    /// Open minConnections connections. Fails with AlreadyExists when
    /// already connected and PersistenceError when a connection cannot
    /// be established.
    [[nodiscard]] AuthResult<void> connect(const DatabaseConfig& config);

    /// Close every pooled connection. Safe to call repeatedly.
    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    /// Run a statement that returns rows (SELECT, or DML with RETURNING).
    [[nodiscard]] AuthResult<QueryResult> query(const PreparedStatement& stmt);

    /// Run a command whose rows are not needed (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] AuthResult<void> execute(const PreparedStatement& stmt);

    /// Begin a transaction on a dedicated pooled connection.
    [[nodiscard]] AuthResult<Transaction> beginTransaction();

    /// Number of connections currently checked out.
    [[nodiscard]] std::size_t activeConnections() const noexcept;

    /// Total number of connections in the pool.
    [[nodiscard]] std::size_t poolSize() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace latchkey::foundation
