#pragma once

/// @file league_database.hpp
/// @brief LeagueDatabase wrapping kcenon database_system with a single
///        serialized connection, named-parameter statements and RAII
///        transactions.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "fcl/foundation/league_result.hpp"

namespace fcl::foundation {

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name -> value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT query.
using QueryResult = std::vector<DbRow>;

enum class DatabaseType : uint8_t {
    PostgreSQL,
    MySQL,
    SQLite
};

struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::SQLite;

    /// How long a caller waits for the connection before giving up.
    std::chrono::seconds connectionTimeout{10};
};

/// SQL text with `$name` placeholders bound by name.
///
/// Strings are quoted with embedded single quotes doubled. resolve() scans
/// the template once, so `$name` text inside a bound value is never
/// substituted again; unbound placeholders are left as written.
///
/// @code
///   SqlStatement stmt("UPDATE matches SET played = TRUE WHERE id = $id");
///   stmt.bindInt("id", 42);
///   txn.execute(stmt.resolve());
/// @endcode
class SqlStatement {
public:
    explicit SqlStatement(std::string sql);

    SqlStatement& bindString(std::string_view name, std::string value);
    SqlStatement& bindInt(std::string_view name, std::int64_t value);
    SqlStatement& bindDouble(std::string_view name, double value);
    SqlStatement& bindBool(std::string_view name, bool value);
    SqlStatement& bindNull(std::string_view name);

    [[nodiscard]] std::string_view sql() const noexcept;

    /// The SQL template with every bound parameter substituted.
    [[nodiscard]] std::string resolve() const;

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

/// Connection-level operations LeagueDatabase drives.
///
/// The production backend wraps kcenon's database_manager; connect()
/// creates it. attach() accepts any other implementation.
class IDatabaseBackend {
public:
    virtual ~IDatabaseBackend() = default;

    [[nodiscard]] virtual LeagueResult<QueryResult> query(std::string_view sql) = 0;
    [[nodiscard]] virtual LeagueResult<void> execute(std::string_view sql) = 0;

    [[nodiscard]] virtual LeagueResult<void> beginTransaction() = 0;
    [[nodiscard]] virtual LeagueResult<void> commitTransaction() = 0;
    [[nodiscard]] virtual LeagueResult<void> rollbackTransaction() = 0;

    virtual void close() = 0;
};

/// RAII transaction guard.
///
/// Holds the connection exclusively until commit(), rollback() or
/// destruction; an unfinished transaction is rolled back on destruction.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] LeagueResult<void> commit();
    [[nodiscard]] LeagueResult<void> rollback();

    [[nodiscard]] LeagueResult<QueryResult> query(std::string_view sql);
    [[nodiscard]] LeagueResult<void> execute(std::string_view sql);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class LeagueDatabase;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

/// Database adapter over kcenon's database_system.
///
/// League writes are small and must be serialized per lobby anyway, so a
/// single connection guarded by a timed mutex replaces a pool. PIMPL keeps
/// kcenon headers out of this header.
class LeagueDatabase {
public:
    LeagueDatabase();
    ~LeagueDatabase();

    LeagueDatabase(const LeagueDatabase&) = delete;
    LeagueDatabase& operator=(const LeagueDatabase&) = delete;
    LeagueDatabase(LeagueDatabase&&) noexcept;
    LeagueDatabase& operator=(LeagueDatabase&&) noexcept;

    /// Open a kcenon database_system connection for @p config.
    [[nodiscard]] LeagueResult<void> connect(const DatabaseConfig& config);

    /// Take ownership of an already opened backend.
    [[nodiscard]] LeagueResult<void> attach(std::unique_ptr<IDatabaseBackend> backend,
                                            std::chrono::seconds connectionTimeout =
                                                std::chrono::seconds{10});

    void disconnect();
    [[nodiscard]] bool isConnected() const noexcept;

    /// Execute a SELECT outside any transaction.
    [[nodiscard]] LeagueResult<QueryResult> query(std::string_view sql);

    /// Execute INSERT/UPDATE/DELETE/DDL outside any transaction.
    [[nodiscard]] LeagueResult<void> execute(std::string_view sql);

    /// Begin a transaction; blocks other callers until it ends.
    [[nodiscard]] LeagueResult<Transaction> beginTransaction();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fcl::foundation
