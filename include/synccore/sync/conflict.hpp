#pragma once

#include "synccore/core/result.hpp"
#include "synccore/sync/conflict_cache.hpp"
#include "synccore/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace synccore::sync {

enum class DetectionMode {
    Windowed,  ///< Compare within fixed-size index windows (bounded cost, may miss far-apart pairs)
    Grouped    ///< Partition by entity first, then compare every pair inside a partition
};

struct ResolverConfig {
    std::size_t batch_size = 100;
    std::size_t cache_capacity = ConflictCache::kDefaultCapacity;
    DetectionMode detection_mode = DetectionMode::Windowed;

    /**
     * @brief Read overrides from a JSON object
     *
     * Recognised keys: "batch_size", "cache_capacity" (non-negative integers)
     * and "detection_mode" ("windowed" | "grouped"). Other keys are ignored.
     */
    static Result<ResolverConfig> from_json(const nlohmann::json& j);
};

/**
 * @brief Detects and resolves conflicts between operations on the same entity
 *
 * Detection and resolution are pure functions of their inputs; the only
 * shared state is the ConflictCache, which is internally locked. Resolvers
 * constructed with the same cache handle share memoised results.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(ResolverConfig config = {});
    ConflictResolver(ResolverConfig config, std::shared_ptr<ConflictCache> cache);

    /**
     * @brief Classify a pair of operations
     *
     * std::nullopt when the operations touch different entities, when one
     * causally precedes the other, or when either is a Reference.
     */
    std::optional<ConflictType> detect_conflict(const SyncOperation& first,
                                                const SyncOperation& second) const;

    /**
     * @brief Pick the policy outcome for a pair
     *
     * KeepBoth when the pair does not conflict at all.
     */
    ConflictResolution resolve_conflict(const SyncOperation& first,
                                        const SyncOperation& second) const;

    /**
     * @brief Combine two operations into one that causally dominates both
     *
     * Object payloads are overlaid field by field with second winning on
     * collisions; the clock is the pointwise maximum; the timestamp is the
     * later one. The result is identified as "<first.id>+<second.id>", so
     * ConflictCache entries recorded for either input never answer for it.
     */
    SyncOperation merge_updates(const SyncOperation& first, const SyncOperation& second) const;

    /**
     * @brief Find conflicting pairs, comparing each operation only with the
     *        later operations of its batch_size-wide index window
     *
     * batch_size 0 means a single window spanning the whole input.
     */
    std::vector<DetectedConflict> detect_conflicts_batch(const std::vector<SyncOperation>& operations,
                                                         std::size_t batch_size) const;

    /**
     * @brief Find conflicting pairs by comparing every pair that shares an entity
     *
     * Result is ordered by (first, second).
     */
    std::vector<DetectedConflict> detect_conflicts_grouped(const std::vector<SyncOperation>& operations) const;

    /**
     * @brief Reduce a batch to one surviving operation per resolved conflict
     *
     * Uses the configured detection mode. Output order carries no causal
     * meaning; pass the result through causal_sort() before applying it.
     */
    std::vector<SyncOperation> resolve_conflicts_batch(const std::vector<SyncOperation>& operations) const;

    [[nodiscard]] const ResolverConfig& config() const noexcept { return config_; }
    [[nodiscard]] ConflictCache& cache() const noexcept { return *cache_; }
    [[nodiscard]] std::shared_ptr<ConflictCache> shared_cache() const noexcept { return cache_; }

private:
    std::optional<ConflictType> detect_cached(const SyncOperation& first,
                                              const SyncOperation& second) const;

    ResolverConfig config_;
    std::shared_ptr<ConflictCache> cache_;
};

/**
 * @brief Order operations so that every operation follows those that
 *        happened before it
 *
 * Concurrent operations are ordered by timestamp, then by input position.
 */
std::vector<SyncOperation> causal_sort(std::vector<SyncOperation> operations);

} // namespace synccore::sync
