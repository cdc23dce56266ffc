#include "synccore/sync/conflict.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace synccore::sync {
namespace {

using clock::CausalRelation;

std::optional<ConflictType> classify(OperationType first, OperationType second) {
    if (first == OperationType::Reference || second == OperationType::Reference) {
        return std::nullopt;
    }
    // Order the pair so each unordered combination has a single spelling
    if (static_cast<int>(second) < static_cast<int>(first)) {
        std::swap(first, second);
    }

    switch (first) {
        case OperationType::Create:
            switch (second) {
                case OperationType::Create: return ConflictType::CreateCreate;
                case OperationType::Update: return ConflictType::CreateUpdate;
                case OperationType::Delete: return ConflictType::CreateDelete;
                default: return std::nullopt;
            }
        case OperationType::Update:
            switch (second) {
                case OperationType::Update: return ConflictType::UpdateUpdate;
                case OperationType::Delete: return ConflictType::UpdateDelete;
                default: return std::nullopt;
            }
        case OperationType::Delete:
            return second == OperationType::Delete ? std::optional<ConflictType>(ConflictType::DeleteDelete)
                                                   : std::nullopt;
        default:
            return std::nullopt;
    }
}

bool same_entity(const SyncOperation& first, const SyncOperation& second) {
    if (first.entity_type != second.entity_type) {
        return false;
    }
    if (first.entity_id && second.entity_id && *first.entity_id != *second.entity_id) {
        return false;
    }
    return true;
}

std::size_t field_count(const Payload& payload) {
    return payload.is_object() ? payload.size() : 0;
}

ConflictResolution later_timestamp_wins(const SyncOperation& first, const SyncOperation& second) {
    return first.timestamp >= second.timestamp ? ConflictResolution::KeepFirst : ConflictResolution::KeepSecond;
}

// The delete only survives when strictly newer; on a tie the surviving data is kept.
ConflictResolution resolve_against_delete(const SyncOperation& first, const SyncOperation& second) {
    const bool first_is_delete = first.operation_type == OperationType::Delete;
    const SyncOperation& deletion = first_is_delete ? first : second;
    const SyncOperation& survivor = first_is_delete ? second : first;

    const bool delete_wins = deletion.timestamp > survivor.timestamp;
    if (delete_wins == first_is_delete) {
        return ConflictResolution::KeepFirst;
    }
    return ConflictResolution::KeepSecond;
}

Payload overlay(const Payload& base, const Payload& top) {
    if (base.is_object() && top.is_object()) {
        Payload merged = base;
        for (const auto& item : top.items()) {
            merged[item.key()] = item.value();
        }
        return merged;
    }
    return top.is_null() ? base : top;
}

void record_pair(std::vector<DetectedConflict>& out,
                 std::vector<bool>& processed,
                 std::size_t i,
                 std::size_t j,
                 ConflictType type) {
    out.push_back(DetectedConflict{i, j, type});
    // One delete suffices; the duplicate needs no further comparisons
    if (type == ConflictType::DeleteDelete) {
        processed[j] = true;
    }
}

} // namespace

const char* to_string(ConflictType type) noexcept {
    switch (type) {
        case ConflictType::CreateCreate: return "CreateCreate";
        case ConflictType::CreateUpdate: return "CreateUpdate";
        case ConflictType::CreateDelete: return "CreateDelete";
        case ConflictType::UpdateUpdate: return "UpdateUpdate";
        case ConflictType::UpdateDelete: return "UpdateDelete";
        case ConflictType::DeleteDelete: return "DeleteDelete";
    }
    return "Unknown";
}

const char* to_string(ConflictResolution resolution) noexcept {
    switch (resolution) {
        case ConflictResolution::KeepFirst: return "KeepFirst";
        case ConflictResolution::KeepSecond: return "KeepSecond";
        case ConflictResolution::Merge: return "Merge";
        case ConflictResolution::KeepBoth: return "KeepBoth";
    }
    return "Unknown";
}

Result<ResolverConfig> ResolverConfig::from_json(const nlohmann::json& j) {
    ResolverConfig config;
    if (!j.is_object()) {
        return Err<ResolverConfig>(Error{ErrorCode::Serialization, "Resolver config must be a JSON object"});
    }

    auto read_size = [&j](const char* key, std::size_t& target) -> Result<void> {
        const auto it = j.find(key);
        if (it == j.end()) {
            return Ok();
        }
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
            return Err<void>(Error{ErrorCode::Serialization,
                                   std::string("Config key '") + key + "' must be a non-negative integer"});
        }
        target = static_cast<std::size_t>(it->get<std::int64_t>());
        return Ok();
    };

    auto batch = read_size("batch_size", config.batch_size);
    if (batch.is_error()) {
        return Err<ResolverConfig>(batch.error());
    }
    auto capacity = read_size("cache_capacity", config.cache_capacity);
    if (capacity.is_error()) {
        return Err<ResolverConfig>(capacity.error());
    }

    const auto mode = j.find("detection_mode");
    if (mode != j.end()) {
        if (!mode->is_string()) {
            return Err<ResolverConfig>(Error{ErrorCode::Serialization, "Config key 'detection_mode' must be a string"});
        }
        const auto name = mode->get<std::string>();
        if (name == "windowed") {
            config.detection_mode = DetectionMode::Windowed;
        } else if (name == "grouped") {
            config.detection_mode = DetectionMode::Grouped;
        } else {
            return Err<ResolverConfig>(Error{ErrorCode::Serialization, "Unknown detection_mode: " + name});
        }
    }

    if (config.cache_capacity == 0) {
        spdlog::warn("cache_capacity is 0, conflict results will not be memoised");
    }
    return Ok(config);
}

ConflictResolver::ConflictResolver(ResolverConfig config)
    : config_(config),
      cache_(std::make_shared<ConflictCache>(config.cache_capacity)) {}

ConflictResolver::ConflictResolver(ResolverConfig config, std::shared_ptr<ConflictCache> cache)
    : config_(config),
      cache_(cache ? std::move(cache) : std::make_shared<ConflictCache>(config.cache_capacity)) {}

std::optional<ConflictType> ConflictResolver::detect_conflict(const SyncOperation& first,
                                                              const SyncOperation& second) const {
    if (!same_entity(first, second)) {
        return std::nullopt;
    }

    const auto relation = first.vector_clock.causal_relation(second.vector_clock);
    if (relation == CausalRelation::HappensBefore || relation == CausalRelation::HappensAfter) {
        return std::nullopt;
    }

    auto type = classify(first.operation_type, second.operation_type);
    if (type) {
        spdlog::debug("{} conflict between {} and {} ({})",
                      to_string(*type), first.id, second.id, clock::to_string(relation));
    }
    return type;
}

ConflictResolution ConflictResolver::resolve_conflict(const SyncOperation& first,
                                                      const SyncOperation& second) const {
    const auto type = detect_conflict(first, second);
    if (!type) {
        return ConflictResolution::KeepBoth;
    }

    switch (*type) {
        case ConflictType::CreateCreate: {
            const auto first_fields = field_count(first.payload);
            const auto second_fields = field_count(second.payload);
            if (first_fields != second_fields) {
                return first_fields > second_fields ? ConflictResolution::KeepFirst
                                                    : ConflictResolution::KeepSecond;
            }
            return later_timestamp_wins(first, second);
        }
        case ConflictType::CreateUpdate:
            return ConflictResolution::Merge;
        case ConflictType::CreateDelete:
        case ConflictType::UpdateDelete:
            return resolve_against_delete(first, second);
        case ConflictType::UpdateUpdate:
            if (first.vector_clock.causal_relation(second.vector_clock) == CausalRelation::Concurrent) {
                return ConflictResolution::Merge;
            }
            return later_timestamp_wins(first, second);
        case ConflictType::DeleteDelete:
            return ConflictResolution::KeepFirst;
    }
    return ConflictResolution::KeepBoth;
}

SyncOperation ConflictResolver::merge_updates(const SyncOperation& first, const SyncOperation& second) const {
    SyncOperation merged = first;
    // New content needs a new id; cached answers for either input's id describe the old clocks
    merged.id = first.id + "+" + second.id;
    if (first.operation_type == OperationType::Create || second.operation_type == OperationType::Create) {
        merged.operation_type = OperationType::Create;
    }
    if (!merged.entity_id) {
        merged.entity_id = second.entity_id;
    }
    merged.payload = overlay(first.payload, second.payload);
    merged.vector_clock = first.vector_clock.merged_with(second.vector_clock);
    merged.timestamp = std::max(first.timestamp, second.timestamp);
    return merged;
}

std::optional<ConflictType> ConflictResolver::detect_cached(const SyncOperation& first,
                                                            const SyncOperation& second) const {
    const auto cached = cache_->get(first.id, second.id);
    if (cached && !*cached) {
        return std::nullopt;
    }
    auto type = detect_conflict(first, second);
    if (!cached) {
        cache_->set(first.id, second.id, type.has_value());
    }
    return type;
}

std::vector<DetectedConflict> ConflictResolver::detect_conflicts_batch(const std::vector<SyncOperation>& operations,
                                                                      std::size_t batch_size) const {
    std::vector<DetectedConflict> conflicts;
    const std::size_t count = operations.size();
    if (count == 0) {
        return conflicts;
    }

    const std::size_t window = batch_size == 0 ? count : batch_size;
    std::vector<bool> processed(count, false);

    for (std::size_t i = 0; i < count; ++i) {
        if (processed[i]) {
            continue;
        }
        const std::size_t window_start = (i / window) * window;
        const std::size_t window_end = std::min(window_start + window, count);

        for (std::size_t j = i + 1; j < window_end; ++j) {
            if (processed[j]) {
                continue;
            }
            if (auto type = detect_cached(operations[i], operations[j])) {
                record_pair(conflicts, processed, i, j, *type);
            }
        }
    }

    spdlog::debug("Windowed detection: {} operations, window {}, {} conflicts",
                  count, window, conflicts.size());
    return conflicts;
}

std::vector<DetectedConflict> ConflictResolver::detect_conflicts_grouped(
    const std::vector<SyncOperation>& operations) const {
    struct TypeGroup {
        std::map<std::string, std::vector<std::size_t>> by_entity_id;
        std::vector<std::size_t> without_id;
        std::vector<std::size_t> all;
    };

    std::map<std::string, TypeGroup> groups;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto& group = groups[operations[i].entity_type];
        group.all.push_back(i);
        if (operations[i].entity_id) {
            group.by_entity_id[*operations[i].entity_id].push_back(i);
        } else {
            group.without_id.push_back(i);
        }
    }

    // Candidate pairs: same entity id, or any pair involving an id-less operation
    std::set<std::pair<std::size_t, std::size_t>> candidates;
    for (const auto& [entity_type, group] : groups) {
        for (const auto& [entity_id, members] : group.by_entity_id) {
            for (std::size_t a = 0; a < members.size(); ++a) {
                for (std::size_t b = a + 1; b < members.size(); ++b) {
                    candidates.emplace(members[a], members[b]);
                }
            }
        }
        for (const auto unkeyed : group.without_id) {
            for (const auto other : group.all) {
                if (other != unkeyed) {
                    candidates.emplace(std::min(unkeyed, other), std::max(unkeyed, other));
                }
            }
        }
    }

    std::vector<DetectedConflict> conflicts;
    std::vector<bool> processed(operations.size(), false);
    for (const auto& [i, j] : candidates) {
        if (processed[i] || processed[j]) {
            continue;
        }
        if (auto type = detect_cached(operations[i], operations[j])) {
            record_pair(conflicts, processed, i, j, *type);
        }
    }

    spdlog::debug("Grouped detection: {} operations in {} entity types, {} candidate pairs, {} conflicts",
                  operations.size(), groups.size(), candidates.size(), conflicts.size());
    return conflicts;
}

std::vector<SyncOperation> ConflictResolver::resolve_conflicts_batch(
    const std::vector<SyncOperation>& operations) const {
    const auto conflicts = config_.detection_mode == DetectionMode::Grouped
        ? detect_conflicts_grouped(operations)
        : detect_conflicts_batch(operations, config_.batch_size);

    std::vector<SyncOperation> resolved;
    resolved.reserve(operations.size());
    std::vector<bool> consumed(operations.size(), false);
    std::size_t applied = 0;

    for (const auto& conflict : conflicts) {
        if (consumed[conflict.first] || consumed[conflict.second]) {
            continue;
        }
        const auto& first = operations[conflict.first];
        const auto& second = operations[conflict.second];

        const auto resolution = resolve_conflict(first, second);
        spdlog::debug("Resolving {} between {} and {}: {}",
                      to_string(conflict.type), first.id, second.id, to_string(resolution));

        switch (resolution) {
            case ConflictResolution::KeepFirst:
                resolved.push_back(first);
                break;
            case ConflictResolution::KeepSecond:
                resolved.push_back(second);
                break;
            case ConflictResolution::Merge: {
                // The create is the base for CreateUpdate; otherwise the newer update overlays the older
                bool second_is_base = false;
                if (conflict.type == ConflictType::CreateUpdate) {
                    second_is_base = second.operation_type == OperationType::Create;
                } else {
                    second_is_base = second.timestamp < first.timestamp;
                }
                resolved.push_back(second_is_base ? merge_updates(second, first) : merge_updates(first, second));
                break;
            }
            case ConflictResolution::KeepBoth:
                resolved.push_back(first);
                resolved.push_back(second);
                break;
        }
        consumed[conflict.first] = true;
        consumed[conflict.second] = true;
        ++applied;
    }

    // Operations left over here either never conflicted or lost their partner to an earlier pair
    for (std::size_t i = 0; i < operations.size(); ++i) {
        if (!consumed[i]) {
            resolved.push_back(operations[i]);
        }
    }

    spdlog::info("Resolved {} conflicts: {} operations in, {} out",
                 applied, operations.size(), resolved.size());
    return resolved;
}

std::vector<SyncOperation> causal_sort(std::vector<SyncOperation> operations) {
    const std::size_t count = operations.size();
    std::vector<std::vector<std::size_t>> successors(count);
    std::vector<std::size_t> pending_predecessors(count, 0);

    for (std::size_t i = 0; i < count; ++i) {
        for (std::size_t j = i + 1; j < count; ++j) {
            const auto relation = operations[i].vector_clock.causal_relation(operations[j].vector_clock);
            if (relation == CausalRelation::HappensBefore) {
                successors[i].push_back(j);
                ++pending_predecessors[j];
            } else if (relation == CausalRelation::HappensAfter) {
                successors[j].push_back(i);
                ++pending_predecessors[i];
            }
        }
    }

    std::set<std::pair<Timestamp, std::size_t>> ready;
    for (std::size_t i = 0; i < count; ++i) {
        if (pending_predecessors[i] == 0) {
            ready.emplace(operations[i].timestamp, i);
        }
    }

    std::vector<SyncOperation> ordered;
    ordered.reserve(count);
    while (!ready.empty()) {
        const auto index = ready.begin()->second;
        ready.erase(ready.begin());
        for (const auto next : successors[index]) {
            if (--pending_predecessors[next] == 0) {
                ready.emplace(operations[next].timestamp, next);
            }
        }
        ordered.push_back(std::move(operations[index]));
    }
    return ordered;
}

} // namespace synccore::sync
