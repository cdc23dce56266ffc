#pragma once

#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace synccore::sync {

/**
 * @brief Bounded memo of pairwise "do these two operations conflict?" answers
 *
 * Keys are the two operation ids in lexicographic order, so (a, b) and
 * (b, a) share one entry. When full, the least recently accessed entry is
 * evicted. Every call takes the internal lock for the duration of a single
 * lookup or insert, so one cache can be shared by resolvers running on
 * different threads.
 */
class ConflictCache {
public:
    static constexpr std::size_t kDefaultCapacity = 10000;

    explicit ConflictCache(std::size_t capacity = kDefaultCapacity);

    ConflictCache(const ConflictCache&) = delete;
    ConflictCache& operator=(const ConflictCache&) = delete;

    /// Cached answer for the pair, refreshing its recency.
    std::optional<bool> get(const std::string& first_id, const std::string& second_id);

    /// Store an answer, evicting the stalest entry first when at capacity.
    void set(const std::string& first_id, const std::string& second_id, bool conflicting);

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Key = std::pair<std::string, std::string>;

    struct Entry {
        bool conflicting = false;
        std::list<Key>::iterator recency;
    };

    static Key make_key(const std::string& first_id, const std::string& second_id);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
    std::list<Key> recency_;  ///< Front = most recently accessed
};

} // namespace synccore::sync
