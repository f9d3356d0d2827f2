#include "result_cache.hpp"
#include "hash_util.hpp"
#include <algorithm>
#include <iostream>

ResultCache::ResultCache(size_t capacity) : max_entries(std::max<size_t>(1, capacity)) {}

ResultCache::Key ResultCache::makeKey(const Configuration& config, const TimeSeries& prices,
                                      const TimeSeries& solar) {
    Fnv1aHasher hasher;
    uint64_t parts[] = {config.fingerprint(), prices.fingerprint(), solar.fingerprint()};
    hasher.addBytes(parts, sizeof(parts));
    return hasher.digest();
}

ResultCache::Entry ResultCache::get(Key key) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = entries.find(key);
    if (it != entries.end()) {
        ++hit_count;
        return it->second;
    }
    ++miss_count;
    return nullptr;
}

void ResultCache::put(Key key, Entry entry) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = entries.find(key);
    if (it != entries.end()) {
        it->second = std::move(entry);
        return;
    }
    while (entries.size() >= max_entries) {
        entries.erase(insertion_order.front());
        insertion_order.pop_front();
    }
    entries.emplace(key, std::move(entry));
    insertion_order.push_back(key);
}

ResultCache::Entry ResultCache::getOrCompare(const Configuration& config, const TimeSeries& prices,
                                             const TimeSeries& solar) {
    Key key = makeKey(config, prices, solar);
    if (Entry cached = get(key)) {
        std::cout << "Cache hit for key " << std::hex << key << std::dec << std::endl;
        return cached;
    }

    ScenarioComparator comparator(config);
    auto computed = std::make_shared<const ScenarioComparison>(comparator.compare(prices, solar));
    put(key, computed);
    return computed;
}

size_t ResultCache::size() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return entries.size();
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    entries.clear();
    insertion_order.clear();
    hit_count = 0;
    miss_count = 0;
}

size_t ResultCache::hits() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return hit_count;
}

size_t ResultCache::misses() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return miss_count;
}
