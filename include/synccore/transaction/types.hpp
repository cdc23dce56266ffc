#pragma once

#include "synccore/core/result.hpp"
#include "synccore/core/time.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace synccore::transaction {

/**
 * @brief Lifecycle of a sync transaction
 *
 * Pending -> InProgress -> Completed
 *    |           |-------> Failed
 *    |           '-------> RolledBack
 *    '-------------------> Failed | RolledBack
 *
 * Completed, Failed and RolledBack are terminal.
 */
enum class TransactionStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    RolledBack
};

/**
 * @brief Persisted names for TransactionStatus ("pending", "in_progress", ...)
 */
class TransactionStatusUtils {
public:
    static std::string to_string(TransactionStatus status) {
        switch (status) {
            case TransactionStatus::Pending: return "pending";
            case TransactionStatus::InProgress: return "in_progress";
            case TransactionStatus::Completed: return "completed";
            case TransactionStatus::Failed: return "failed";
            case TransactionStatus::RolledBack: return "rolled_back";
            default: return "unknown";
        }
    }

    static Result<TransactionStatus> from_string(const std::string& name) {
        if (name == "pending") return Ok(TransactionStatus::Pending);
        if (name == "in_progress") return Ok(TransactionStatus::InProgress);
        if (name == "completed") return Ok(TransactionStatus::Completed);
        if (name == "failed") return Ok(TransactionStatus::Failed);
        if (name == "rolled_back") return Ok(TransactionStatus::RolledBack);
        return Err<TransactionStatus>(Error{ErrorCode::Serialization, "Unknown transaction status: " + name});
    }

    static bool is_terminal(TransactionStatus status) noexcept {
        return status == TransactionStatus::Completed ||
               status == TransactionStatus::Failed ||
               status == TransactionStatus::RolledBack;
    }
};

/**
 * @brief The synchronization request that opens a transaction
 */
struct SyncEvent {
    std::optional<std::string> transaction_id;  ///< Generated when absent
    std::string entity_type;
    std::string entity_id;
    std::string operation;
    std::string source_system;
    std::string target_system;
    Timestamp timestamp{};
    nlohmann::json data = nlohmann::json::object();
};

struct TransactionStep {
    std::string transaction_id;
    Timestamp timestamp{};
    std::string description;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief A transaction as reconstructed from storage (or held by its handler)
 */
struct SyncTransaction {
    std::string id;
    std::string entity_type;
    std::string operation;
    std::string source_system;
    std::string target_system;
    Timestamp start_time{};
    std::optional<Timestamp> end_time;
    TransactionStatus status = TransactionStatus::Pending;
    std::optional<std::int64_t> duration_ms;
    std::optional<std::string> error_message;
    nlohmann::json event_data = nlohmann::json::object();
    std::vector<TransactionStep> steps;  ///< Ordered by timestamp
};

/**
 * @brief sync_transactions row, columns as stored
 */
struct TransactionRow {
    std::string transaction_id;
    std::string entity_type;
    std::string operation;
    std::string source_system;
    std::string target_system;
    std::string start_time;
    std::optional<std::string> end_time;
    std::string status;
    std::optional<std::int64_t> duration_ms;
    std::optional<std::string> error_message;
    std::string event_data;
};

/**
 * @brief sync_transaction_steps row, columns as stored
 */
struct StepRow {
    std::int64_t id = 0;  ///< Assigned by the store
    std::string transaction_id;
    std::string timestamp;
    std::string description;
    std::string step_data;
};

} // namespace synccore::transaction
