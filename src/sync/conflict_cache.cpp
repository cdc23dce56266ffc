#include "synccore/sync/conflict_cache.hpp"

namespace synccore::sync {

ConflictCache::ConflictCache(std::size_t capacity) : capacity_(capacity) {}

ConflictCache::Key ConflictCache::make_key(const std::string& first_id, const std::string& second_id) {
    if (second_id < first_id) {
        return Key{second_id, first_id};
    }
    return Key{first_id, second_id};
}

std::optional<bool> ConflictCache::get(const std::string& first_id, const std::string& second_id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(make_key(first_id, second_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    recency_.splice(recency_.begin(), recency_, it->second.recency);
    return it->second.conflicting;
}

void ConflictCache::set(const std::string& first_id, const std::string& second_id, bool conflicting) {
    if (capacity_ == 0) {
        return;
    }

    std::lock_guard lock(mutex_);
    auto key = make_key(first_id, second_id);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.conflicting = conflicting;
        recency_.splice(recency_.begin(), recency_, it->second.recency);
        return;
    }

    if (entries_.size() >= capacity_) {
        entries_.erase(recency_.back());
        recency_.pop_back();
    }

    recency_.push_front(key);
    entries_.emplace(std::move(key), Entry{conflicting, recency_.begin()});
}

void ConflictCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    recency_.clear();
}

std::size_t ConflictCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace synccore::sync
