#include "synccore/transaction/handler.hpp"
#include "synccore/transaction/codec.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace synccore::transaction {

std::string generate_transaction_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> distribution;

    std::uint64_t high = distribution(engine);
    std::uint64_t low = distribution(engine);
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // variant 1

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

SyncTransactionHandler::SyncTransactionHandler(SyncEvent event, TransactionStore& store)
    : store_(store),
      timer_(std::chrono::steady_clock::now()) {
    transaction_.id = event.transaction_id ? std::move(*event.transaction_id) : generate_transaction_id();
    transaction_.entity_type = std::move(event.entity_type);
    transaction_.operation = std::move(event.operation);
    transaction_.source_system = std::move(event.source_system);
    transaction_.target_system = std::move(event.target_system);
    transaction_.start_time = std::chrono::system_clock::now();
    transaction_.status = TransactionStatus::Pending;
    transaction_.event_data = nlohmann::json{
        {"entity_id", std::move(event.entity_id)},
        {"timestamp", format_timestamp(event.timestamp)},
        {"data", std::move(event.data)},
    };
}

Result<void> SyncTransactionHandler::begin() {
    if (transaction_.status != TransactionStatus::Pending) {
        return Err<void>(Error{ErrorCode::InvalidState,
                               "Cannot begin transaction in state " + TransactionStatusUtils::to_string(transaction_.status)});
    }

    spdlog::info("Beginning sync transaction: {}", transaction_.id);

    SyncTransaction started = transaction_;
    started.status = TransactionStatus::InProgress;
    auto row = RowCodec::to_row(started);
    if (row.is_error()) {
        return Err<void>(row.error());
    }
    auto inserted = store_.insert_transaction(row.value());
    if (inserted.is_error()) {
        return inserted;
    }

    persisted_ = true;
    transaction_.status = TransactionStatus::InProgress;
    return Ok();
}

Result<void> SyncTransactionHandler::record_step(const std::string& description, const nlohmann::json& data) {
    if (TransactionStatusUtils::is_terminal(transaction_.status)) {
        return Err<void>(Error{ErrorCode::InvalidState,
                               "Cannot record step on " + TransactionStatusUtils::to_string(transaction_.status) +
                               " transaction " + transaction_.id});
    }
    return append_step(description, data);
}

Result<void> SyncTransactionHandler::commit() {
    if (transaction_.status != TransactionStatus::InProgress) {
        return Err<void>(Error{ErrorCode::InvalidState,
                               "Cannot commit transaction in state " + TransactionStatusUtils::to_string(transaction_.status)});
    }

    spdlog::info("Committing sync transaction: {}", transaction_.id);
    return finish(TransactionStatus::Completed, std::nullopt);
}

Result<void> SyncTransactionHandler::rollback(const std::string& reason) {
    if (TransactionStatusUtils::is_terminal(transaction_.status)) {
        return Err<void>(Error{ErrorCode::InvalidState, "Transaction already finished: " + transaction_.id});
    }

    spdlog::error("Rolling back sync transaction: {}, Error: {}", transaction_.id, reason);
    auto finished = finish(TransactionStatus::RolledBack, reason);
    if (finished.is_error()) {
        return finished;
    }
    return append_step("Transaction rolled back", nlohmann::json{{"error", reason}});
}

Result<void> SyncTransactionHandler::fail(const std::string& reason) {
    if (TransactionStatusUtils::is_terminal(transaction_.status)) {
        return Err<void>(Error{ErrorCode::InvalidState, "Transaction already finished: " + transaction_.id});
    }

    spdlog::error("Marking sync transaction as failed: {}, Error: {}", transaction_.id, reason);
    auto finished = finish(TransactionStatus::Failed, reason);
    if (finished.is_error()) {
        return finished;
    }
    return append_step("Transaction failed", nlohmann::json{{"error", reason}});
}

Result<void> SyncTransactionHandler::finish(TransactionStatus final_status, std::optional<std::string> error_message) {
    SyncTransaction finished = transaction_;
    finished.status = final_status;
    finished.end_time = std::chrono::system_clock::now();
    finished.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - timer_).count();
    finished.error_message = std::move(error_message);

    auto row = RowCodec::to_row(finished);
    if (row.is_error()) {
        return Err<void>(row.error());
    }

    // A transaction abandoned before begin() has no row yet
    auto written = persisted_ ? store_.update_transaction(row.value()) : store_.insert_transaction(row.value());
    if (written.is_error()) {
        return written;
    }

    persisted_ = true;
    transaction_ = std::move(finished);
    return Ok();
}

Result<void> SyncTransactionHandler::append_step(const std::string& description, const nlohmann::json& data) {
    TransactionStep step;
    step.transaction_id = transaction_.id;
    step.timestamp = std::chrono::system_clock::now();
    step.description = description;
    step.data = data;

    auto row = RowCodec::to_row(step);
    if (row.is_error()) {
        return Err<void>(row.error());
    }
    auto inserted = store_.insert_step(row.value());
    if (inserted.is_error()) {
        return inserted;
    }

    spdlog::debug("Transaction {} step: {}", transaction_.id, description);
    transaction_.steps.push_back(std::move(step));
    return Ok();
}

Result<SyncTransaction> SyncTransactionHandler::get_by_id(const TransactionStore& store,
                                                          const std::string& transaction_id) {
    auto row = store.find_transaction(transaction_id);
    if (row.is_error()) {
        return Err<SyncTransaction>(row.error());
    }
    auto transaction = RowCodec::from_row(row.value());
    if (transaction.is_error()) {
        return Err<SyncTransaction>(transaction.error());
    }

    auto step_rows = store.list_steps(transaction_id);
    if (step_rows.is_error()) {
        return Err<SyncTransaction>(step_rows.error());
    }
    for (const auto& step_row : step_rows.value()) {
        auto step = RowCodec::from_row(step_row);
        if (step.is_error()) {
            return Err<SyncTransaction>(step.error());
        }
        transaction.value().steps.push_back(std::move(step.value()));
    }
    return transaction;
}

Result<std::vector<SyncTransaction>> SyncTransactionHandler::list_recent(const TransactionStore& store,
                                                                         std::size_t limit) {
    auto rows = store.list_recent(limit);
    if (rows.is_error()) {
        return Err<std::vector<SyncTransaction>>(rows.error());
    }

    std::vector<SyncTransaction> transactions;
    transactions.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto transaction = RowCodec::from_row(row);
        if (transaction.is_error()) {
            return Err<std::vector<SyncTransaction>>(transaction.error());
        }
        transactions.push_back(std::move(transaction.value()));
    }
    return Ok(std::move(transactions));
}

} // namespace synccore::transaction
