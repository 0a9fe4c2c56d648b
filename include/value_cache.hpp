#ifndef VALUE_CACHE_H
#define VALUE_CACHE_H

#include "terminal_model.hpp"
#include <map>
#include <mutex>
#include <optional>

/**
 * @struct CachedValue
 * @brief Last good reading of one mapping.
 */
struct CachedValue {
    double value = 0.0;
    uint16_t raw = 0;
    Timestamp timestamp;
};

/**
 * @class ValueCache
 * @brief Last-known-good values with thread-safe access.
 *
 * The polling thread writes after every successful read; any other thread may
 * read at any time. Nothing but a successful read ever replaces an entry, so a
 * failed read leaves the previous value in place.
 */
class ValueCache {
public:
    /**
     * @brief Stores a fresh reading.
     * @param slave_address Slave the value came from.
     * @param mapping_id Mapping the value was scaled for.
     * @param entry The scaled value, raw value and read time.
     */
    void update(int slave_address, int mapping_id, const CachedValue& entry);

    /**
     * @brief Gets the last good reading of a mapping.
     * @return std::nullopt if the mapping was never read successfully.
     */
    std::optional<CachedValue> get(int slave_address, int mapping_id) const;

    /// @brief Copy of every cached value.
    std::map<ValueKey, CachedValue> entries() const;

    void clear();
    size_t size() const;

private:
    mutable std::mutex cache_mutex;
    std::map<ValueKey, CachedValue> values;
};

#endif // VALUE_CACHE_H
