#ifndef RESULT_CACHE_H
#define RESULT_CACHE_H

#include "configuration.hpp"
#include "scenario_comparator.hpp"
#include "time_series.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

/**
 * @class ResultCache
 * @brief Thread-safe, content-addressed store of scenario comparisons.
 *
 * Entries are keyed by a hash of the configuration and of both input series,
 * so a changed parameter or a changed sample always misses. Stored results are
 * immutable and shared between callers. The cache holds at most a fixed number
 * of entries and evicts the oldest stored one when full.
 */
class ResultCache {
public:
    using Key = uint64_t;
    using Entry = std::shared_ptr<const ScenarioComparison>;

    static constexpr size_t kDefaultCapacity = 256;

    /**
     * @param capacity Maximum number of stored comparisons; at least one is kept.
     */
    explicit ResultCache(size_t capacity = kDefaultCapacity);

    /**
     * @brief Builds the cache key for a run.
     */
    static Key makeKey(const Configuration& config, const TimeSeries& prices, const TimeSeries& solar);

    /**
     * @brief Looks up a stored comparison.
     * @return The entry, or nullptr on a miss.
     */
    Entry get(Key key);

    /**
     * @brief Stores a comparison, replacing any entry under the same key.
     *
     * A new key evicts the oldest stored entry once the cache is full.
     */
    void put(Key key, Entry entry);

    /**
     * @brief Returns the stored comparison for the inputs, running the comparator on a miss.
     *
     * The comparison runs outside the lock, so concurrent misses on the same key
     * may both compute; the results are identical and the later store wins.
     */
    Entry getOrCompare(const Configuration& config, const TimeSeries& prices, const TimeSeries& solar);

    size_t size();
    size_t capacity() const { return max_entries; }
    void clear();

    size_t hits();
    size_t misses();

private:
    std::mutex cache_mutex;
    size_t max_entries;
    std::unordered_map<Key, Entry> entries;
    std::deque<Key> insertion_order;
    size_t hit_count = 0;
    size_t miss_count = 0;
};

#endif // RESULT_CACHE_H
