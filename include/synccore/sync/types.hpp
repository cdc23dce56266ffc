#pragma once

#include "synccore/clock/version_vector.hpp"
#include "synccore/core/result.hpp"
#include "synccore/core/time.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace synccore::sync {

/// Structured operation payload: null, bool, number, string, array or object.
using Payload = nlohmann::json;

enum class OperationType {
    Create,
    Update,
    Delete,
    Reference
};

enum class ConflictType {
    CreateCreate,
    CreateUpdate,
    CreateDelete,
    UpdateUpdate,
    UpdateDelete,
    DeleteDelete
};

enum class ConflictResolution {
    KeepFirst,
    KeepSecond,
    Merge,
    KeepBoth
};

/**
 * @brief One replica's change to one entity, as collected for reconciliation
 *
 * Produced upstream and stamped with the originating replica's clock
 * increment; treated as an immutable input here.
 */
struct SyncOperation {
    std::string id;
    std::string entity_type;
    std::optional<std::string> entity_id;  ///< Absent for type-wide operations
    OperationType operation_type = OperationType::Update;
    clock::VersionVector vector_clock;
    Timestamp timestamp{};
    Payload payload = Payload::object();
};

/**
 * @brief A conflicting pair found by batch detection (indices into the input)
 */
struct DetectedConflict {
    std::size_t first = 0;
    std::size_t second = 0;
    ConflictType type = ConflictType::UpdateUpdate;
};

inline bool operator==(const DetectedConflict& lhs, const DetectedConflict& rhs) {
    return lhs.first == rhs.first && lhs.second == rhs.second && lhs.type == rhs.type;
}

/**
 * @brief String conversions for OperationType (JSON codec, logs)
 */
class OperationTypeUtils {
public:
    static Result<OperationType> from_string(const std::string& name) {
        if (name == "create") return Ok(OperationType::Create);
        if (name == "update") return Ok(OperationType::Update);
        if (name == "delete") return Ok(OperationType::Delete);
        if (name == "reference") return Ok(OperationType::Reference);
        return Err<OperationType>(Error{ErrorCode::Serialization, "Unknown operation type: " + name});
    }

    static std::string to_string(OperationType type) {
        switch (type) {
            case OperationType::Create: return "create";
            case OperationType::Update: return "update";
            case OperationType::Delete: return "delete";
            case OperationType::Reference: return "reference";
            default: return "unknown";
        }
    }
};

const char* to_string(ConflictType type) noexcept;
const char* to_string(ConflictResolution resolution) noexcept;

} // namespace synccore::sync
