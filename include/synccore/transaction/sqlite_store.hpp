#pragma once

#include "synccore/core/result.hpp"
#include "synccore/transaction/store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace synccore::transaction {

/**
 * @brief TransactionStore backed by a SQLite database
 *
 * open() creates both tables if they do not exist. One connection is shared
 * by all callers and serialised by an internal mutex.
 */
class SqliteTransactionStore : public TransactionStore {
public:
    /**
     * @brief Open (or create) the database at path; ":memory:" for a private in-memory database
     */
    static Result<std::unique_ptr<SqliteTransactionStore>> open(const std::string& path);

    ~SqliteTransactionStore() override;

    SqliteTransactionStore(const SqliteTransactionStore&) = delete;
    SqliteTransactionStore& operator=(const SqliteTransactionStore&) = delete;

    Result<void> insert_transaction(const TransactionRow& row) override;
    Result<void> update_transaction(const TransactionRow& row) override;
    Result<void> insert_step(const StepRow& row) override;

    Result<TransactionRow> find_transaction(const std::string& transaction_id) const override;
    Result<std::vector<StepRow>> list_steps(const std::string& transaction_id) const override;
    Result<std::vector<TransactionRow>> list_recent(std::size_t limit) const override;

    const std::string& path() const noexcept { return path_; }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* statement) const noexcept;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    SqliteTransactionStore(sqlite3* db, std::string path);

    Result<void> create_tables();
    Result<Statement> prepare(const char* sql) const;
    Error storage_error(const std::string& context) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace synccore::transaction
