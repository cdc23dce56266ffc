#include "synccore/transaction/codec.hpp"

namespace synccore::transaction {

Result<std::string> RowCodec::encode_json(const nlohmann::json& value) {
    try {
        return Ok(value.dump());
    } catch (const nlohmann::json::exception& e) {
        return Err<std::string>(Error{ErrorCode::Serialization, std::string("Failed to encode JSON: ") + e.what()});
    }
}

Result<nlohmann::json> RowCodec::decode_json(const std::string& text) {
    if (text.empty()) {
        return Ok(nlohmann::json::object());
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<nlohmann::json>(Error{ErrorCode::Serialization, "Stored JSON column is not valid JSON"});
    }
    return Ok(std::move(parsed));
}

Result<TransactionRow> RowCodec::to_row(const SyncTransaction& transaction) {
    auto event_data = encode_json(transaction.event_data);
    if (event_data.is_error()) {
        return Err<TransactionRow>(event_data.error());
    }

    TransactionRow row;
    row.transaction_id = transaction.id;
    row.entity_type = transaction.entity_type;
    row.operation = transaction.operation;
    row.source_system = transaction.source_system;
    row.target_system = transaction.target_system;
    row.start_time = format_timestamp(transaction.start_time);
    if (transaction.end_time) {
        row.end_time = format_timestamp(*transaction.end_time);
    }
    row.status = TransactionStatusUtils::to_string(transaction.status);
    row.duration_ms = transaction.duration_ms;
    row.error_message = transaction.error_message;
    row.event_data = std::move(event_data.value());
    return Ok(std::move(row));
}

Result<StepRow> RowCodec::to_row(const TransactionStep& step) {
    auto data = encode_json(step.data);
    if (data.is_error()) {
        return Err<StepRow>(data.error());
    }

    StepRow row;
    row.transaction_id = step.transaction_id;
    row.timestamp = format_timestamp(step.timestamp);
    row.description = step.description;
    row.step_data = std::move(data.value());
    return Ok(std::move(row));
}

Result<SyncTransaction> RowCodec::from_row(const TransactionRow& row) {
    SyncTransaction transaction;
    transaction.id = row.transaction_id;
    transaction.entity_type = row.entity_type;
    transaction.operation = row.operation;
    transaction.source_system = row.source_system;
    transaction.target_system = row.target_system;

    auto start = parse_timestamp(row.start_time);
    if (start.is_error()) {
        return Err<SyncTransaction>(start.error());
    }
    transaction.start_time = start.value();

    if (row.end_time) {
        auto end = parse_timestamp(*row.end_time);
        if (end.is_error()) {
            return Err<SyncTransaction>(end.error());
        }
        transaction.end_time = end.value();
    }

    auto status = TransactionStatusUtils::from_string(row.status);
    if (status.is_error()) {
        return Err<SyncTransaction>(status.error());
    }
    transaction.status = status.value();
    transaction.duration_ms = row.duration_ms;
    transaction.error_message = row.error_message;

    auto event_data = decode_json(row.event_data);
    if (event_data.is_error()) {
        return Err<SyncTransaction>(event_data.error());
    }
    transaction.event_data = std::move(event_data.value());
    return Ok(std::move(transaction));
}

Result<TransactionStep> RowCodec::from_row(const StepRow& row) {
    auto timestamp = parse_timestamp(row.timestamp);
    if (timestamp.is_error()) {
        return Err<TransactionStep>(timestamp.error());
    }
    auto data = decode_json(row.step_data);
    if (data.is_error()) {
        return Err<TransactionStep>(data.error());
    }

    TransactionStep step;
    step.transaction_id = row.transaction_id;
    step.timestamp = timestamp.value();
    step.description = row.description;
    step.data = std::move(data.value());
    return Ok(std::move(step));
}

} // namespace synccore::transaction
