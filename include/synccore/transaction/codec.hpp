#pragma once

#include "synccore/core/result.hpp"
#include "synccore/transaction/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace synccore::transaction {

/**
 * @brief Conversions between transaction records and their stored rows
 *
 * JSON columns (event_data, step_data) are serialized here, and timestamps
 * are written with format_timestamp(). Any failure is a Serialization error.
 */
class RowCodec {
public:
    static Result<std::string> encode_json(const nlohmann::json& value);
    static Result<nlohmann::json> decode_json(const std::string& text);

    /// The columns written when a transaction is first inserted or finalised.
    static Result<TransactionRow> to_row(const SyncTransaction& transaction);
    static Result<StepRow> to_row(const TransactionStep& step);

    /// Steps are not part of the row; the caller attaches them.
    static Result<SyncTransaction> from_row(const TransactionRow& row);
    static Result<TransactionStep> from_row(const StepRow& row);
};

} // namespace synccore::transaction
