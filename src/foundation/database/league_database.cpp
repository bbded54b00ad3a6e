/// @file league_database.cpp
/// @brief LeagueDatabase implementation wrapping kcenon database_system.

#include "fcl/foundation/league_database.hpp"
#include "fcl/foundation/league_logger.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <atomic>
#include <cctype>
#include <mutex>
#include <type_traits>

namespace fcl::foundation {

static ::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::sqlite;
}

static QueryResult convertResult(
    const ::database::core::database_result& kcResult) {
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

// ---------------------------------------------------------------------------
// SqlStatement
// ---------------------------------------------------------------------------

SqlStatement::SqlStatement(std::string sql)
    : sql_(std::move(sql)) {}

SqlStatement& SqlStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

SqlStatement& SqlStatement::bindInt(std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

SqlStatement& SqlStatement::bindDouble(std::string_view name, double value) {
    params_[std::string(name)] = value;
    return *this;
}

SqlStatement& SqlStatement::bindBool(std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

SqlStatement& SqlStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

std::string_view SqlStatement::sql() const noexcept {
    return sql_;
}

static std::string literal(const DbValue& val) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string escaped;
            escaped.reserve(arg.size() + 2);
            escaped += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    escaped += "''";
                } else {
                    escaped += c;
                }
            }
            escaped += '\'';
            return escaped;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "TRUE" : "FALSE";
        } else {
            return std::to_string(arg);
        }
    }, val);
}

static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string SqlStatement::resolve() const {
    std::string resolved;
    resolved.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        auto dollar = sql_.find('$', pos);
        if (dollar == std::string::npos) {
            resolved.append(sql_, pos, std::string::npos);
            break;
        }
        resolved.append(sql_, pos, dollar - pos);

        auto end = dollar + 1;
        while (end < sql_.size() && isIdentChar(sql_[end])) {
            ++end;
        }
        auto it = params_.find(sql_.substr(dollar + 1, end - dollar - 1));
        if (end > dollar + 1 && it != params_.end()) {
            resolved += literal(it->second);
        } else {
            resolved.append(sql_, dollar, end - dollar);
        }
        pos = end;
    }

    return resolved;
}

// ---------------------------------------------------------------------------
// kcenon database_system backend
// ---------------------------------------------------------------------------

namespace {

class KcenonBackend final : public IDatabaseBackend {
public:
    explicit KcenonBackend(std::shared_ptr<::database::database_context> context)
        : context_(std::move(context)),
          manager_(std::make_shared<::database::database_manager>(context_)) {}

    LeagueResult<void> open(const DatabaseConfig& config) {
        if (!manager_->set_mode(toKcenon(config.dbType))) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::DatabaseError, "unsupported database backend"));
        }
        auto result = manager_->connect_result(config.connectionString);
        if (!result.is_ok()) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::DatabaseError,
                            "connect failed: " + result.error().message));
        }
        return LeagueResult<void>::ok();
    }

    LeagueResult<QueryResult> query(std::string_view sql) override {
        auto result = manager_->select_query_result(std::string(sql));
        if (!result.is_ok()) {
            return LeagueResult<QueryResult>::err(
                LeagueError(ErrorCode::QueryFailed, result.error().message));
        }
        return LeagueResult<QueryResult>::ok(convertResult(result.value()));
    }

    LeagueResult<void> execute(std::string_view sql) override {
        auto result = manager_->execute_query_result(std::string(sql));
        if (!result.is_ok()) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::QueryFailed, result.error().message));
        }
        return LeagueResult<void>::ok();
    }

    LeagueResult<void> beginTransaction() override {
        auto result = manager_->begin_transaction();
        if (!result.is_ok()) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::TransactionFailed,
                            "failed to begin transaction: " + result.error().message));
        }
        return LeagueResult<void>::ok();
    }

    LeagueResult<void> commitTransaction() override {
        auto result = manager_->commit_transaction();
        if (!result.is_ok()) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::TransactionFailed,
                            "commit failed: " + result.error().message));
        }
        return LeagueResult<void>::ok();
    }

    LeagueResult<void> rollbackTransaction() override {
        auto result = manager_->rollback_transaction();
        if (!result.is_ok()) {
            return LeagueResult<void>::err(
                LeagueError(ErrorCode::TransactionFailed,
                            "rollback failed: " + result.error().message));
        }
        return LeagueResult<void>::ok();
    }

    void close() override {
        (void)manager_->disconnect_result();
    }

private:
    std::shared_ptr<::database::database_context> context_;
    std::shared_ptr<::database::database_manager> manager_;
};

// ---------------------------------------------------------------------------
// Connection shared by the database and its live transactions
// ---------------------------------------------------------------------------

struct Connection {
    std::unique_ptr<IDatabaseBackend> backend;
    std::timed_mutex mutex;
};

template <typename T>
LeagueResult<T> logged(LeagueResult<T> result, std::string_view op, std::string_view sql) {
    if (!result) {
        LogContext ctx;
        ctx.extra["op"] = std::string(op);
        ctx.extra["sql"] = std::string(sql.substr(0, 80));
        FCL_LOG_CTX(LogLevel::Error, LogCategory::Database,
                    std::string(result.error().message()), ctx);
    }
    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    std::shared_ptr<Connection> connection;
    std::unique_lock<std::timed_mutex> lock;
    bool active = true;

    void abandon() {
        auto result = connection->backend->rollbackTransaction();
        if (!result) {
            FCL_LOG_ERROR(LogCategory::Database,
                          "rollback of abandoned transaction failed: " +
                              std::string(result.error().message()));
        }
        active = false;
    }
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    if (impl_ && impl_->active) {
        impl_->abandon();
    }
}

Transaction::Transaction(Transaction&&) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (impl_ && impl_->active) {
            impl_->abandon();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

LeagueResult<void> Transaction::commit() {
    if (!isActive()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->connection->backend->commitTransaction();
    impl_->active = false;
    impl_->lock.unlock();
    return logged(std::move(result), "commit", {});
}

LeagueResult<void> Transaction::rollback() {
    if (!isActive()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->connection->backend->rollbackTransaction();
    impl_->active = false;
    impl_->lock.unlock();
    return logged(std::move(result), "rollback", {});
}

LeagueResult<QueryResult> Transaction::query(std::string_view sql) {
    if (!isActive()) {
        return LeagueResult<QueryResult>::err(
            LeagueError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    return logged(impl_->connection->backend->query(sql), "query", sql);
}

LeagueResult<void> Transaction::execute(std::string_view sql) {
    if (!isActive()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::TransactionFailed, "transaction not active"));
    }
    return logged(impl_->connection->backend->execute(sql), "execute", sql);
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// LeagueDatabase
// ---------------------------------------------------------------------------

struct LeagueDatabase::Impl {
    std::chrono::seconds connectionTimeout{10};
    std::shared_ptr<Connection> connection;
    std::atomic<bool> connected{false};

    std::unique_lock<std::timed_mutex> acquire() {
        std::unique_lock<std::timed_mutex> lock(connection->mutex, std::defer_lock);
        if (!lock.try_lock_for(connectionTimeout)) {
            FCL_LOG_WARN(LogCategory::Database, "timed out waiting for connection");
        }
        return lock;
    }
};

LeagueDatabase::LeagueDatabase()
    : impl_(std::make_unique<Impl>()) {}

LeagueDatabase::~LeagueDatabase() {
    if (impl_) {
        disconnect();
    }
}

LeagueDatabase::LeagueDatabase(LeagueDatabase&&) noexcept = default;

LeagueDatabase& LeagueDatabase::operator=(LeagueDatabase&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

LeagueResult<void> LeagueDatabase::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::AlreadyExists, "already connected"));
    }

    auto backend = std::make_unique<KcenonBackend>(
        std::make_shared<::database::database_context>());
    if (auto opened = logged(backend->open(config), "connect", {}); !opened) {
        return opened;
    }
    return attach(std::move(backend), config.connectionTimeout);
}

LeagueResult<void> LeagueDatabase::attach(std::unique_ptr<IDatabaseBackend> backend,
                                          std::chrono::seconds connectionTimeout) {
    if (!backend) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "backend must not be null"));
    }
    if (impl_->connected.load()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::AlreadyExists, "already connected"));
    }

    auto conn = std::make_shared<Connection>();
    conn->backend = std::move(backend);
    impl_->connectionTimeout = connectionTimeout;
    impl_->connection = std::move(conn);
    impl_->connected.store(true);
    FCL_LOG_INFO(LogCategory::Database, "database connected");
    return LeagueResult<void>::ok();
}

void LeagueDatabase::disconnect() {
    if (!impl_->connected.exchange(false)) {
        return;
    }
    std::lock_guard lock(impl_->connection->mutex);
    impl_->connection->backend->close();
}

bool LeagueDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

LeagueResult<QueryResult> LeagueDatabase::query(std::string_view sql) {
    if (!impl_->connected.load()) {
        return LeagueResult<QueryResult>::err(
            LeagueError(ErrorCode::NotConnected, "not connected to database"));
    }
    auto lock = impl_->acquire();
    if (!lock.owns_lock()) {
        return LeagueResult<QueryResult>::err(
            LeagueError(ErrorCode::ConnectionTimeout, "timed out waiting for connection"));
    }
    return logged(impl_->connection->backend->query(sql), "query", sql);
}

LeagueResult<void> LeagueDatabase::execute(std::string_view sql) {
    if (!impl_->connected.load()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::NotConnected, "not connected to database"));
    }
    auto lock = impl_->acquire();
    if (!lock.owns_lock()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::ConnectionTimeout, "timed out waiting for connection"));
    }
    return logged(impl_->connection->backend->execute(sql), "execute", sql);
}

LeagueResult<Transaction> LeagueDatabase::beginTransaction() {
    if (!impl_->connected.load()) {
        return LeagueResult<Transaction>::err(
            LeagueError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto lock = impl_->acquire();
    if (!lock.owns_lock()) {
        return LeagueResult<Transaction>::err(
            LeagueError(ErrorCode::ConnectionTimeout, "timed out waiting for connection"));
    }

    auto begun = logged(impl_->connection->backend->beginTransaction(), "begin", {});
    if (!begun) {
        return LeagueResult<Transaction>::err(begun.error());
    }

    auto txnImpl = std::make_unique<Transaction::Impl>();
    txnImpl->connection = impl_->connection;
    txnImpl->lock = std::move(lock);
    txnImpl->active = true;

    return LeagueResult<Transaction>::ok(Transaction(std::move(txnImpl)));
}

} // namespace fcl::foundation
