#include "synccore/transaction/sqlite_store.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <cstdint>
#include <optional>

namespace synccore::transaction {
namespace {

constexpr const char* kCreateTransactionsTable = R"sql(
    CREATE TABLE IF NOT EXISTS sync_transactions (
        transaction_id TEXT PRIMARY KEY,
        entity_type TEXT NOT NULL,
        operation TEXT NOT NULL,
        source_system TEXT NOT NULL,
        target_system TEXT NOT NULL,
        start_time TEXT NOT NULL,
        end_time TEXT,
        status TEXT NOT NULL,
        duration_ms INTEGER,
        error_message TEXT,
        event_data TEXT
    )
)sql";

constexpr const char* kCreateStepsTable = R"sql(
    CREATE TABLE IF NOT EXISTS sync_transaction_steps (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        transaction_id TEXT NOT NULL,
        timestamp TEXT NOT NULL,
        description TEXT NOT NULL,
        step_data TEXT,
        FOREIGN KEY (transaction_id) REFERENCES sync_transactions (transaction_id)
    )
)sql";

constexpr const char* kSelectTransactionColumns =
    "SELECT transaction_id, entity_type, operation, source_system, target_system, "
    "start_time, end_time, status, duration_ms, error_message, event_data "
    "FROM sync_transactions ";

void bind_text(sqlite3_stmt* statement, int index, const std::string& value) {
    sqlite3_bind_text(statement, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* statement, int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(statement, index, *value);
    } else {
        sqlite3_bind_null(statement, index);
    }
}

void bind_optional_int64(sqlite3_stmt* statement, int index, const std::optional<std::int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(statement, index, *value);
    } else {
        sqlite3_bind_null(statement, index);
    }
}

std::string column_text(sqlite3_stmt* statement, int column) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(statement, column));
    if (text == nullptr) {
        return {};
    }
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(statement, column)));
}

std::optional<std::string> column_optional_text(sqlite3_stmt* statement, int column) {
    if (sqlite3_column_type(statement, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(statement, column);
}

std::optional<std::int64_t> column_optional_int64(sqlite3_stmt* statement, int column) {
    if (sqlite3_column_type(statement, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(statement, column);
}

TransactionRow read_transaction_row(sqlite3_stmt* statement) {
    TransactionRow row;
    row.transaction_id = column_text(statement, 0);
    row.entity_type = column_text(statement, 1);
    row.operation = column_text(statement, 2);
    row.source_system = column_text(statement, 3);
    row.target_system = column_text(statement, 4);
    row.start_time = column_text(statement, 5);
    row.end_time = column_optional_text(statement, 6);
    row.status = column_text(statement, 7);
    row.duration_ms = column_optional_int64(statement, 8);
    row.error_message = column_optional_text(statement, 9);
    row.event_data = column_text(statement, 10);
    return row;
}

} // namespace

void SqliteTransactionStore::StatementDeleter::operator()(sqlite3_stmt* statement) const noexcept {
    sqlite3_finalize(statement);
}

Result<std::unique_ptr<SqliteTransactionStore>> SqliteTransactionStore::open(const std::string& path) {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        spdlog::error("Failed to open transaction database {}: {}", path, message);
        return Err<std::unique_ptr<SqliteTransactionStore>>(
            Error{ErrorCode::Storage, "Failed to open " + path + ": " + message});
    }

    // The constructor is private so that every store comes out of open() with its tables
    std::unique_ptr<SqliteTransactionStore> store(new SqliteTransactionStore(db, path));
    auto tables = store->create_tables();
    if (tables.is_error()) {
        return Err<std::unique_ptr<SqliteTransactionStore>>(tables.error());
    }

    spdlog::debug("Opened transaction database {}", path);
    return Ok(std::move(store));
}

SqliteTransactionStore::SqliteTransactionStore(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteTransactionStore::~SqliteTransactionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Error SqliteTransactionStore::storage_error(const std::string& context) const {
    std::string message = context + ": " + sqlite3_errmsg(db_);
    spdlog::error("Transaction store error: {}", message);
    return Error{ErrorCode::Storage, std::move(message)};
}

Result<void> SqliteTransactionStore::create_tables() {
    std::lock_guard lock(mutex_);
    for (const char* sql : {kCreateTransactionsTable, kCreateStepsTable}) {
        char* error_message = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_message) != SQLITE_OK) {
            std::string message = error_message ? error_message : "unknown error";
            sqlite3_free(error_message);
            spdlog::error("Failed to create transaction tables: {}", message);
            return Err<void>(Error{ErrorCode::Storage, "Failed to create tables: " + message});
        }
    }
    return Ok();
}

Result<SqliteTransactionStore::Statement> SqliteTransactionStore::prepare(const char* sql) const {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return Err<Statement>(storage_error("Failed to prepare statement"));
    }
    return Ok(Statement(raw));
}

Result<void> SqliteTransactionStore::insert_transaction(const TransactionRow& row) {
    std::lock_guard lock(mutex_);
    auto statement = prepare(
        "INSERT INTO sync_transactions (transaction_id, entity_type, operation, source_system, "
        "target_system, start_time, end_time, status, duration_ms, error_message, event_data) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (statement.is_error()) {
        return Err<void>(statement.error());
    }

    auto* stmt = statement.value().get();
    bind_text(stmt, 1, row.transaction_id);
    bind_text(stmt, 2, row.entity_type);
    bind_text(stmt, 3, row.operation);
    bind_text(stmt, 4, row.source_system);
    bind_text(stmt, 5, row.target_system);
    bind_text(stmt, 6, row.start_time);
    bind_optional_text(stmt, 7, row.end_time);
    bind_text(stmt, 8, row.status);
    bind_optional_int64(stmt, 9, row.duration_ms);
    bind_optional_text(stmt, 10, row.error_message);
    bind_text(stmt, 11, row.event_data);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return Err<void>(storage_error("Failed to insert transaction " + row.transaction_id));
    }
    return Ok();
}

Result<void> SqliteTransactionStore::update_transaction(const TransactionRow& row) {
    std::lock_guard lock(mutex_);
    auto statement = prepare(
        "UPDATE sync_transactions SET status = ?, end_time = ?, duration_ms = ?, error_message = ? "
        "WHERE transaction_id = ?");
    if (statement.is_error()) {
        return Err<void>(statement.error());
    }

    auto* stmt = statement.value().get();
    bind_text(stmt, 1, row.status);
    bind_optional_text(stmt, 2, row.end_time);
    bind_optional_int64(stmt, 3, row.duration_ms);
    bind_optional_text(stmt, 4, row.error_message);
    bind_text(stmt, 5, row.transaction_id);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return Err<void>(storage_error("Failed to update transaction " + row.transaction_id));
    }
    if (sqlite3_changes(db_) == 0) {
        spdlog::error("Transaction store error: update matched no row for {}", row.transaction_id);
        return Err<void>(Error{ErrorCode::Storage, "Cannot update missing transaction: " + row.transaction_id});
    }
    return Ok();
}

Result<void> SqliteTransactionStore::insert_step(const StepRow& row) {
    std::lock_guard lock(mutex_);
    auto statement = prepare(
        "INSERT INTO sync_transaction_steps (transaction_id, timestamp, description, step_data) "
        "VALUES (?, ?, ?, ?)");
    if (statement.is_error()) {
        return Err<void>(statement.error());
    }

    auto* stmt = statement.value().get();
    bind_text(stmt, 1, row.transaction_id);
    bind_text(stmt, 2, row.timestamp);
    bind_text(stmt, 3, row.description);
    bind_text(stmt, 4, row.step_data);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return Err<void>(storage_error("Failed to insert step for " + row.transaction_id));
    }
    return Ok();
}

Result<TransactionRow> SqliteTransactionStore::find_transaction(const std::string& transaction_id) const {
    std::lock_guard lock(mutex_);
    const std::string sql = std::string(kSelectTransactionColumns) + "WHERE transaction_id = ?";
    auto statement = prepare(sql.c_str());
    if (statement.is_error()) {
        return Err<TransactionRow>(statement.error());
    }

    auto* stmt = statement.value().get();
    bind_text(stmt, 1, transaction_id);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return Err<TransactionRow>(Error{ErrorCode::NotFound, "Transaction not found: " + transaction_id});
    }
    if (rc != SQLITE_ROW) {
        return Err<TransactionRow>(storage_error("Failed to read transaction " + transaction_id));
    }
    return Ok(read_transaction_row(stmt));
}

Result<std::vector<StepRow>> SqliteTransactionStore::list_steps(const std::string& transaction_id) const {
    std::lock_guard lock(mutex_);
    auto statement = prepare(
        "SELECT id, transaction_id, timestamp, description, step_data FROM sync_transaction_steps "
        "WHERE transaction_id = ? ORDER BY timestamp, id");
    if (statement.is_error()) {
        return Err<std::vector<StepRow>>(statement.error());
    }

    auto* stmt = statement.value().get();
    bind_text(stmt, 1, transaction_id);

    std::vector<StepRow> steps;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StepRow row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.transaction_id = column_text(stmt, 1);
        row.timestamp = column_text(stmt, 2);
        row.description = column_text(stmt, 3);
        row.step_data = column_text(stmt, 4);
        steps.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<StepRow>>(storage_error("Failed to read steps of " + transaction_id));
    }
    return Ok(std::move(steps));
}

Result<std::vector<TransactionRow>> SqliteTransactionStore::list_recent(std::size_t limit) const {
    std::lock_guard lock(mutex_);
    const std::string sql = std::string(kSelectTransactionColumns) + "ORDER BY start_time DESC, rowid DESC LIMIT ?";
    auto statement = prepare(sql.c_str());
    if (statement.is_error()) {
        return Err<std::vector<TransactionRow>>(statement.error());
    }

    auto* stmt = statement.value().get();
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

    std::vector<TransactionRow> rows;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(read_transaction_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<TransactionRow>>(storage_error("Failed to list recent transactions"));
    }
    return Ok(std::move(rows));
}

} // namespace synccore::transaction
