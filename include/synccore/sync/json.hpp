#pragma once

#include "synccore/core/result.hpp"
#include "synccore/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace synccore::sync {

/**
 * @brief JSON form of a SyncOperation
 *
 * {
 *   "id": "op-1",
 *   "entity_type": "course",
 *   "entity_id": "101",                       // optional
 *   "operation_type": "update",
 *   "vector_clock": {"desktop": 3, "server": 1},
 *   "timestamp": "2024-01-02T03:04:05.000000Z",
 *   "payload": {...}                          // any JSON value
 * }
 */
nlohmann::json operation_to_json(const SyncOperation& operation);

Result<SyncOperation> operation_from_json(const nlohmann::json& j);

Result<std::vector<SyncOperation>> operations_from_json(const nlohmann::json& j);

} // namespace synccore::sync
