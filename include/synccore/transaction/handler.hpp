#pragma once

#include "synccore/core/result.hpp"
#include "synccore/core/time.hpp"
#include "synccore/transaction/store.hpp"
#include "synccore/transaction/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace synccore::transaction {

/**
 * @brief Records one synchronization unit of work for audit and rollback
 *
 * Owned by a single sync session; not safe for concurrent mutation. Every
 * state change is written through to the TransactionStore before the call
 * returns, and a store failure is returned to the caller untouched.
 */
class SyncTransactionHandler {
public:
    SyncTransactionHandler(SyncEvent event, TransactionStore& store);

    [[nodiscard]] const std::string& transaction_id() const noexcept { return transaction_.id; }
    [[nodiscard]] TransactionStatus status() const noexcept { return transaction_.status; }
    [[nodiscard]] const std::vector<TransactionStep>& steps() const noexcept { return transaction_.steps; }
    [[nodiscard]] const SyncTransaction& transaction() const noexcept { return transaction_; }

    /// Pending -> InProgress; writes the initial row.
    Result<void> begin();

    /// Append a step; rejected once the transaction is terminal.
    Result<void> record_step(const std::string& description,
                             const nlohmann::json& data = nlohmann::json::object());

    /// InProgress -> Completed; stamps end time and duration.
    Result<void> commit();

    /// Non-terminal -> RolledBack, then appends a "Transaction rolled back" step.
    Result<void> rollback(const std::string& reason);

    /// Non-terminal -> Failed, then appends a "Transaction failed" step.
    Result<void> fail(const std::string& reason);

    /**
     * @brief Load a transaction and its ordered steps from storage
     *
     * Always reads the store, so it also sees transactions written by other
     * sessions. NotFound when no row matches.
     */
    static Result<SyncTransaction> get_by_id(const TransactionStore& store, const std::string& transaction_id);

    /// Most recent transactions by start time, newest first (steps not loaded).
    static Result<std::vector<SyncTransaction>> list_recent(const TransactionStore& store, std::size_t limit);

private:
    Result<void> finish(TransactionStatus final_status, std::optional<std::string> error_message);
    Result<void> append_step(const std::string& description, const nlohmann::json& data);

    SyncTransaction transaction_;
    TransactionStore& store_;
    MonotonicTime timer_;
    bool persisted_ = false;
};

/// Random RFC 4122 version 4 identifier, used when a SyncEvent carries none.
std::string generate_transaction_id();

} // namespace synccore::transaction
