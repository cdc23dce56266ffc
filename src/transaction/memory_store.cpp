#include "synccore/transaction/store.hpp"

#include <algorithm>
#include <mutex>

namespace synccore::transaction {

Result<void> InMemoryTransactionStore::insert_transaction(const TransactionRow& row) {
    std::unique_lock lock(mutex_);

    if (transactions_.find(row.transaction_id) != transactions_.end()) {
        return Err<void>(Error{ErrorCode::Storage, "Transaction already exists: " + row.transaction_id});
    }

    transactions_.emplace(row.transaction_id, StoredTransaction{row, next_sequence_++});
    return Ok();
}

Result<void> InMemoryTransactionStore::update_transaction(const TransactionRow& row) {
    std::unique_lock lock(mutex_);

    auto it = transactions_.find(row.transaction_id);
    if (it == transactions_.end()) {
        return Err<void>(Error{ErrorCode::Storage, "Cannot update missing transaction: " + row.transaction_id});
    }

    auto& stored = it->second.row;
    stored.status = row.status;
    stored.end_time = row.end_time;
    stored.duration_ms = row.duration_ms;
    stored.error_message = row.error_message;
    return Ok();
}

Result<void> InMemoryTransactionStore::insert_step(const StepRow& row) {
    std::unique_lock lock(mutex_);

    StepRow stored = row;
    stored.id = next_step_id_++;
    steps_.push_back(std::move(stored));
    return Ok();
}

Result<TransactionRow> InMemoryTransactionStore::find_transaction(const std::string& transaction_id) const {
    std::shared_lock lock(mutex_);

    auto it = transactions_.find(transaction_id);
    if (it == transactions_.end()) {
        return Err<TransactionRow>(Error{ErrorCode::NotFound, "Transaction not found: " + transaction_id});
    }
    return Ok(it->second.row);
}

Result<std::vector<StepRow>> InMemoryTransactionStore::list_steps(const std::string& transaction_id) const {
    std::shared_lock lock(mutex_);

    std::vector<StepRow> result;
    for (const auto& step : steps_) {
        if (step.transaction_id == transaction_id) {
            result.push_back(step);
        }
    }
    // steps_ is already in insertion order, so a stable sort keeps ties in that order
    std::stable_sort(result.begin(), result.end(), [](const StepRow& a, const StepRow& b) {
        return a.timestamp < b.timestamp;
    });
    return Ok(std::move(result));
}

Result<std::vector<TransactionRow>> InMemoryTransactionStore::list_recent(std::size_t limit) const {
    std::shared_lock lock(mutex_);

    std::vector<const StoredTransaction*> ordered;
    ordered.reserve(transactions_.size());
    for (const auto& [id, stored] : transactions_) {
        ordered.push_back(&stored);
    }
    std::sort(ordered.begin(), ordered.end(), [](const StoredTransaction* a, const StoredTransaction* b) {
        if (a->row.start_time != b->row.start_time) {
            return a->row.start_time > b->row.start_time;
        }
        return a->sequence > b->sequence;
    });

    std::vector<TransactionRow> result;
    const std::size_t count = std::min(limit, ordered.size());
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(ordered[i]->row);
    }
    return Ok(std::move(result));
}

std::size_t InMemoryTransactionStore::transaction_count() const {
    std::shared_lock lock(mutex_);
    return transactions_.size();
}

std::size_t InMemoryTransactionStore::step_count() const {
    std::shared_lock lock(mutex_);
    return steps_.size();
}

} // namespace synccore::transaction
