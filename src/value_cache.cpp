#include "value_cache.hpp"

void ValueCache::update(int slave_address, int mapping_id, const CachedValue& entry) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    values[{slave_address, mapping_id}] = entry;
}

std::optional<CachedValue> ValueCache::get(int slave_address, int mapping_id) const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = values.find({slave_address, mapping_id});
    if (it != values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::map<ValueKey, CachedValue> ValueCache::entries() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return values;
}

void ValueCache::clear() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    values.clear();
}

size_t ValueCache::size() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return values.size();
}
