#pragma once

/**
 * @file version_vector.hpp
 * @brief Per-replica logical clock used to order operations causally
 *
 * WHY THIS FILE EXISTS:
 * Replicas (a desktop client, a server, a phone) edit the same entities
 * while disconnected. Wall-clock timestamps cannot tell us whether one edit
 * had seen the other. A version vector can: every replica bumps its own
 * counter, and comparing two vectors entry by entry yields a partial order.
 *
 * HOW COMPARISON WORKS:
 * A missing replica counts as 0.
 *   {d1:2, d2:1} vs {d1:1, d2:1}  -> HappensAfter  (left saw everything right saw)
 *   {d1:1}       vs {d2:1}        -> Concurrent    (each saw something the other did not)
 *   {d1:1, d2:0} vs {d1:1}        -> Identical
 *
 * HOW IT INTEGRATES:
 * - SyncOperation carries a VersionVector stamped upstream
 * - ConflictResolver only treats Concurrent/Identical pairs as conflicts
 * - Serializer (clock/serializer.hpp) writes the compact wire format
 *
 * THREAD SAFETY:
 * Distinct instances are independent. hash() fills a cache on first use, so
 * a single instance must not be hashed from two threads at once.
 */

#include "synccore/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace synccore::clock {

/// Replica id -> counter. Ordered so that every encoding is canonical.
using CounterMap = std::map<std::string, std::int64_t>;

enum class CausalRelation {
    HappensBefore,  ///< this is an ancestor of other
    HappensAfter,   ///< other is an ancestor of this
    Concurrent,     ///< neither saw the other
    Identical
};

const char* to_string(CausalRelation relation) noexcept;

/**
 * @brief A run of consecutive replicas (in sorted order) sharing one counter
 */
struct CounterRun {
    std::uint32_t length = 0;
    std::int64_t value = 0;
};

/**
 * @brief Run-length encoded form of a version vector
 *
 * replicas holds the sorted replica ids; runs walk that list in order.
 * Vectors where many replicas share a counter (typical after a full merge)
 * shrink to a handful of runs.
 */
struct CompressedVersionVector {
    std::vector<std::string> replicas;
    std::vector<CounterRun> runs;
};

class VersionVector {
public:
    VersionVector() = default;

    /// DataFormat error if any counter is negative.
    static Result<VersionVector> from_mapping(CounterMap counters);

    [[nodiscard]] std::int64_t get(const std::string& replica_id) const;

    /// Bump this replica's counter and return the new value; DataFormat error at INT64_MAX.
    Result<std::int64_t> increment(const std::string& replica_id);

    /// Pointwise maximum, in place.
    void merge(const VersionVector& other);

    [[nodiscard]] VersionVector merged_with(const VersionVector& other) const;

    [[nodiscard]] const CounterMap& to_mapping() const noexcept { return counters_; }

    /**
     * @brief Entries where other is ahead of this vector
     *
     * Sending only the delta is enough for the receiver to catch up:
     * receiver.apply_delta(receiver.create_delta(sender)) == receiver.merge(sender)
     */
    [[nodiscard]] CounterMap create_delta(const VersionVector& other) const;

    /// Raise entries to the delta's values. A negative entry rejects the whole delta.
    Result<void> apply_delta(const CounterMap& delta);

    [[nodiscard]] CompressedVersionVector compress() const;
    static Result<VersionVector> decompress(const CompressedVersionVector& compressed);

    /// Binary wire format, see clock/serializer.hpp.
    [[nodiscard]] Result<std::vector<std::uint8_t>> to_bytes() const;
    static Result<VersionVector> from_bytes(const std::vector<std::uint8_t>& bytes);

    /// Order-independent content hash; cached until the next mutation.
    [[nodiscard]] std::uint64_t hash() const;

    [[nodiscard]] CausalRelation causal_relation(const VersionVector& other) const;

    [[nodiscard]] bool dominates(const VersionVector& other) const;
    [[nodiscard]] bool is_dominated_by(const VersionVector& other) const;
    [[nodiscard]] bool is_concurrent_with(const VersionVector& other) const;

    /**
     * @brief Drop entries of permanently retired replicas
     *
     * Only replicas named in retired_replicas whose counter is <= min_value
     * are removed. Removing a live replica's entry would let its old
     * operations look concurrent with newer ones, so callers must only pass
     * replicas that will never produce another operation.
     *
     * @return number of entries removed
     */
    std::size_t prune_inactive_entries(std::int64_t min_value,
                                       const std::unordered_set<std::string>& retired_replicas);

    [[nodiscard]] std::size_t size() const noexcept { return counters_.size(); }
    [[nodiscard]] bool empty() const noexcept { return counters_.empty(); }

    /// "{d1:2, d2:1}" for logs.
    [[nodiscard]] std::string to_string() const;

private:
    explicit VersionVector(CounterMap counters) : counters_(std::move(counters)) {}

    void invalidate_hash() noexcept { cached_hash_.reset(); }
    void raise_to(const CounterMap& counters);

    CounterMap counters_;
    mutable std::optional<std::uint64_t> cached_hash_;
};

/// Equal when the effective mappings match, treating absent entries as 0.
bool operator==(const VersionVector& lhs, const VersionVector& rhs);
bool operator!=(const VersionVector& lhs, const VersionVector& rhs);

} // namespace synccore::clock
