#include "synccore/sync/json.hpp"

#include <string>

namespace synccore::sync {
namespace {

Result<std::string> required_string(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return Err<std::string>(Error{ErrorCode::Serialization,
                                      std::string("Operation field '") + key + "' must be a string"});
    }
    return Ok(it->get<std::string>());
}

Result<clock::VersionVector> clock_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<clock::VersionVector>(Error{ErrorCode::Serialization, "vector_clock must be an object"});
    }
    clock::CounterMap counters;
    for (const auto& item : j.items()) {
        if (!item.value().is_number_integer() || item.value().get<std::int64_t>() < 0) {
            return Err<clock::VersionVector>(Error{ErrorCode::Serialization,
                                                   "Counter for replica '" + item.key() + "' must be a non-negative integer"});
        }
        counters.emplace(item.key(), item.value().get<std::int64_t>());
    }
    return clock::VersionVector::from_mapping(std::move(counters));
}

} // namespace

nlohmann::json operation_to_json(const SyncOperation& operation) {
    nlohmann::json j;
    j["id"] = operation.id;
    j["entity_type"] = operation.entity_type;
    if (operation.entity_id) {
        j["entity_id"] = *operation.entity_id;
    }
    j["operation_type"] = OperationTypeUtils::to_string(operation.operation_type);

    nlohmann::json clock_json = nlohmann::json::object();
    for (const auto& [replica_id, counter] : operation.vector_clock.to_mapping()) {
        clock_json[replica_id] = counter;
    }
    j["vector_clock"] = std::move(clock_json);
    j["timestamp"] = format_timestamp(operation.timestamp);
    j["payload"] = operation.payload;
    return j;
}

Result<SyncOperation> operation_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<SyncOperation>(Error{ErrorCode::Serialization, "Operation must be a JSON object"});
    }

    SyncOperation operation;

    auto id = required_string(j, "id");
    if (id.is_error()) {
        return Err<SyncOperation>(id.error());
    }
    operation.id = std::move(id.value());

    auto entity_type = required_string(j, "entity_type");
    if (entity_type.is_error()) {
        return Err<SyncOperation>(entity_type.error());
    }
    operation.entity_type = std::move(entity_type.value());

    const auto entity_id = j.find("entity_id");
    if (entity_id != j.end() && !entity_id->is_null()) {
        if (!entity_id->is_string()) {
            return Err<SyncOperation>(Error{ErrorCode::Serialization, "Operation field 'entity_id' must be a string"});
        }
        operation.entity_id = entity_id->get<std::string>();
    }

    auto type_name = required_string(j, "operation_type");
    if (type_name.is_error()) {
        return Err<SyncOperation>(type_name.error());
    }
    auto type = OperationTypeUtils::from_string(type_name.value());
    if (type.is_error()) {
        return Err<SyncOperation>(type.error());
    }
    operation.operation_type = type.value();

    const auto clock_it = j.find("vector_clock");
    if (clock_it != j.end()) {
        auto clock = clock_from_json(*clock_it);
        if (clock.is_error()) {
            return Err<SyncOperation>(clock.error());
        }
        operation.vector_clock = std::move(clock.value());
    }

    auto timestamp_text = required_string(j, "timestamp");
    if (timestamp_text.is_error()) {
        return Err<SyncOperation>(timestamp_text.error());
    }
    auto timestamp = parse_timestamp(timestamp_text.value());
    if (timestamp.is_error()) {
        return Err<SyncOperation>(timestamp.error());
    }
    operation.timestamp = timestamp.value();

    operation.payload = j.value("payload", Payload::object());
    return Ok(std::move(operation));
}

Result<std::vector<SyncOperation>> operations_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        return Err<std::vector<SyncOperation>>(Error{ErrorCode::Serialization, "Operations must be a JSON array"});
    }
    std::vector<SyncOperation> operations;
    operations.reserve(j.size());
    for (const auto& entry : j) {
        auto operation = operation_from_json(entry);
        if (operation.is_error()) {
            return Err<std::vector<SyncOperation>>(operation.error());
        }
        operations.push_back(std::move(operation.value()));
    }
    return Ok(std::move(operations));
}

} // namespace synccore::sync
