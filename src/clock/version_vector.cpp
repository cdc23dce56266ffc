#include "synccore/clock/version_vector.hpp"
#include "synccore/clock/serializer.hpp"

#include <limits>
#include <sstream>

namespace synccore::clock {

const char* to_string(CausalRelation relation) noexcept {
    switch (relation) {
        case CausalRelation::HappensBefore: return "HappensBefore";
        case CausalRelation::HappensAfter: return "HappensAfter";
        case CausalRelation::Concurrent: return "Concurrent";
        case CausalRelation::Identical: return "Identical";
    }
    return "Unknown";
}

namespace {

Result<void> check_non_negative(const CounterMap& counters) {
    for (const auto& [replica_id, counter] : counters) {
        if (counter < 0) {
            return Err<void>(Error{ErrorCode::DataFormat,
                                   "Negative counter " + std::to_string(counter) + " for replica " + replica_id});
        }
    }
    return Ok();
}

} // namespace

Result<VersionVector> VersionVector::from_mapping(CounterMap counters) {
    auto checked = check_non_negative(counters);
    if (checked.is_error()) {
        return Err<VersionVector>(checked.error());
    }
    return Ok(VersionVector(std::move(counters)));
}

std::int64_t VersionVector::get(const std::string& replica_id) const {
    const auto it = counters_.find(replica_id);
    return it == counters_.end() ? 0 : it->second;
}

Result<std::int64_t> VersionVector::increment(const std::string& replica_id) {
    auto& counter = counters_[replica_id];
    if (counter == std::numeric_limits<std::int64_t>::max()) {
        return Err<std::int64_t>(Error{ErrorCode::DataFormat, "Counter overflow for replica " + replica_id});
    }
    invalidate_hash();
    return Ok(++counter);
}

void VersionVector::merge(const VersionVector& other) {
    raise_to(other.counters_);
}

VersionVector VersionVector::merged_with(const VersionVector& other) const {
    VersionVector result(*this);
    result.merge(other);
    return result;
}

CounterMap VersionVector::create_delta(const VersionVector& other) const {
    CounterMap delta;
    for (const auto& [replica_id, counter] : other.counters_) {
        if (counter > get(replica_id)) {
            delta.emplace_hint(delta.end(), replica_id, counter);
        }
    }
    return delta;
}

Result<void> VersionVector::apply_delta(const CounterMap& delta) {
    auto checked = check_non_negative(delta);
    if (checked.is_error()) {
        return checked;
    }
    raise_to(delta);
    return Ok();
}

void VersionVector::raise_to(const CounterMap& counters) {
    bool changed = false;
    for (const auto& [replica_id, counter] : counters) {
        auto [it, inserted] = counters_.emplace(replica_id, counter);
        if (inserted) {
            changed = true;
        } else if (counter > it->second) {
            it->second = counter;
            changed = true;
        }
    }
    if (changed) {
        invalidate_hash();
    }
}

CompressedVersionVector VersionVector::compress() const {
    CompressedVersionVector compressed;
    compressed.replicas.reserve(counters_.size());

    for (const auto& [replica_id, counter] : counters_) {
        compressed.replicas.push_back(replica_id);
        if (!compressed.runs.empty() && compressed.runs.back().value == counter) {
            ++compressed.runs.back().length;
        } else {
            compressed.runs.push_back(CounterRun{1, counter});
        }
    }
    return compressed;
}

Result<VersionVector> VersionVector::decompress(const CompressedVersionVector& compressed) {
    CounterMap counters;
    std::size_t index = 0;

    for (const auto& run : compressed.runs) {
        if (run.value < 0) {
            return Err<VersionVector>(Error{ErrorCode::DataFormat, "Negative counter in compressed version vector"});
        }
        if (run.length == 0) {
            return Err<VersionVector>(Error{ErrorCode::DataFormat, "Empty run in compressed version vector"});
        }
        if (run.length > compressed.replicas.size() - index) {
            return Err<VersionVector>(Error{ErrorCode::DataFormat, "Compressed runs cover more replicas than listed"});
        }
        for (std::uint32_t i = 0; i < run.length; ++i) {
            if (!counters.emplace(compressed.replicas[index + i], run.value).second) {
                return Err<VersionVector>(
                    Error{ErrorCode::DataFormat, "Duplicate replica in compressed version vector: " + compressed.replicas[index + i]});
            }
        }
        index += run.length;
    }

    if (index != compressed.replicas.size()) {
        return Err<VersionVector>(Error{ErrorCode::DataFormat, "Compressed runs cover fewer replicas than listed"});
    }
    return Ok(VersionVector(std::move(counters)));
}

Result<std::vector<std::uint8_t>> VersionVector::to_bytes() const {
    return Serializer::serialize(*this);
}

Result<VersionVector> VersionVector::from_bytes(const std::vector<std::uint8_t>& bytes) {
    return Serializer::deserialize(bytes);
}

std::uint64_t VersionVector::hash() const {
    if (cached_hash_) {
        return *cached_hash_;
    }

    std::uint64_t hash = 0;
    for (const auto& [replica_id, counter] : counters_) {
        // Zero entries are skipped so that equal vectors hash equally
        if (counter == 0) {
            continue;
        }
        std::uint64_t replica_hash = 0;
        for (unsigned char byte : replica_id) {
            replica_hash = replica_hash * 31 + byte;
        }
        hash = hash * 37 + replica_hash;
        hash = hash * 37 + static_cast<std::uint64_t>(counter);
    }

    cached_hash_ = hash;
    return hash;
}

CausalRelation VersionVector::causal_relation(const VersionVector& other) const {
    bool self_greater = false;
    bool other_greater = false;

    for (const auto& [replica_id, self_counter] : counters_) {
        const auto other_counter = other.get(replica_id);
        if (self_counter > other_counter) {
            self_greater = true;
        } else if (self_counter < other_counter) {
            other_greater = true;
        }
        if (self_greater && other_greater) {
            return CausalRelation::Concurrent;
        }
    }

    for (const auto& [replica_id, other_counter] : other.counters_) {
        if (counters_.find(replica_id) != counters_.end()) {
            continue;
        }
        if (other_counter > 0) {
            other_greater = true;
        }
        if (self_greater && other_greater) {
            return CausalRelation::Concurrent;
        }
    }

    if (self_greater) {
        return CausalRelation::HappensAfter;
    }
    if (other_greater) {
        return CausalRelation::HappensBefore;
    }
    return CausalRelation::Identical;
}

bool VersionVector::dominates(const VersionVector& other) const {
    const auto relation = causal_relation(other);
    return relation == CausalRelation::HappensAfter || relation == CausalRelation::Identical;
}

bool VersionVector::is_dominated_by(const VersionVector& other) const {
    const auto relation = causal_relation(other);
    return relation == CausalRelation::HappensBefore || relation == CausalRelation::Identical;
}

bool VersionVector::is_concurrent_with(const VersionVector& other) const {
    return causal_relation(other) == CausalRelation::Concurrent;
}

std::size_t VersionVector::prune_inactive_entries(std::int64_t min_value,
                                                  const std::unordered_set<std::string>& retired_replicas) {
    std::size_t pruned = 0;
    for (auto it = counters_.begin(); it != counters_.end();) {
        if (it->second <= min_value && retired_replicas.count(it->first) > 0) {
            it = counters_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    if (pruned > 0) {
        invalidate_hash();
    }
    return pruned;
}

std::string VersionVector::to_string() const {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [replica_id, counter] : counters_) {
        if (!first) {
            oss << ", ";
        }
        oss << replica_id << ':' << counter;
        first = false;
    }
    oss << '}';
    return oss.str();
}

bool operator==(const VersionVector& lhs, const VersionVector& rhs) {
    return lhs.causal_relation(rhs) == CausalRelation::Identical;
}

bool operator!=(const VersionVector& lhs, const VersionVector& rhs) {
    return !(lhs == rhs);
}

} // namespace synccore::clock
