#pragma once

/**
 * @file store.hpp
 * @brief Storage collaborator for sync transaction audit records
 *
 * WHY THIS FILE EXISTS:
 * A SyncTransactionHandler writes one row per transaction and one row per
 * step. Where those rows live (SQLite file, in-memory table for tests, a
 * host application's own database) is not the handler's concern, so it
 * talks to this interface.
 *
 * SCHEMA (columns mirror TransactionRow / StepRow):
 *   sync_transactions(transaction_id PK, entity_type, operation, source_system,
 *                     target_system, start_time, end_time?, status,
 *                     duration_ms?, error_message?, event_data)
 *   sync_transaction_steps(id PK autoincrement, transaction_id FK,
 *                          timestamp, description, step_data)
 *
 * ERROR CONTRACT:
 * Every failure to read or write is a Storage error; a missing transaction
 * in find_transaction() is NotFound. Implementations never retry.
 *
 * THREAD SAFETY:
 * Implementations must accept concurrent calls for different transaction ids.
 */

#include "synccore/core/result.hpp"
#include "synccore/transaction/types.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace synccore::transaction {

class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    /// Insert a new sync_transactions row. Storage error if the id already exists.
    virtual Result<void> insert_transaction(const TransactionRow& row) = 0;

    /// Overwrite status, end_time, duration_ms and error_message of an existing row.
    virtual Result<void> update_transaction(const TransactionRow& row) = 0;

    /// Append a step row; the store assigns StepRow::id.
    virtual Result<void> insert_step(const StepRow& row) = 0;

    virtual Result<TransactionRow> find_transaction(const std::string& transaction_id) const = 0;

    /// Steps of one transaction ordered by timestamp, ties by insertion order.
    virtual Result<std::vector<StepRow>> list_steps(const std::string& transaction_id) const = 0;

    /// The limit most recent transactions by start_time, newest first.
    virtual Result<std::vector<TransactionRow>> list_recent(std::size_t limit) const = 0;
};

/**
 * @brief Thread-safe in-memory TransactionStore
 *
 * INTERNAL DATA STRUCTURE:
 *   transactions_: transaction_id -> (row, insertion sequence)
 *   steps_:        append-only list of step rows
 *
 * CONCURRENCY MODEL:
 * Reader-writer lock (std::shared_mutex): lookups and listings share the
 * lock, inserts and updates take it exclusively.
 */
class InMemoryTransactionStore : public TransactionStore {
public:
    InMemoryTransactionStore() = default;

    Result<void> insert_transaction(const TransactionRow& row) override;
    Result<void> update_transaction(const TransactionRow& row) override;
    Result<void> insert_step(const StepRow& row) override;

    Result<TransactionRow> find_transaction(const std::string& transaction_id) const override;
    Result<std::vector<StepRow>> list_steps(const std::string& transaction_id) const override;
    Result<std::vector<TransactionRow>> list_recent(std::size_t limit) const override;

    std::size_t transaction_count() const;
    std::size_t step_count() const;

private:
    struct StoredTransaction {
        TransactionRow row;
        std::uint64_t sequence = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, StoredTransaction> transactions_;
    std::vector<StepRow> steps_;
    std::uint64_t next_sequence_ = 0;
    std::int64_t next_step_id_ = 1;
};

} // namespace synccore::transaction
