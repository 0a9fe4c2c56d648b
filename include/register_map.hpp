#ifndef REGISTER_MAP_H
#define REGISTER_MAP_H

#include "terminal_model.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * @struct RegisterPoint
 * @brief One physical item on a slave, with every mapping that reads it.
 */
struct RegisterPoint {
    int register_address = 0;
    int function_code = 0;
    std::vector<RegisterMapping> mappings; ///< Ordered by mapping id
};

/**
 * @struct DevicePlan
 * @brief The points of one slave in the order they are polled.
 */
struct DevicePlan {
    SlaveDevice device;
    std::vector<RegisterPoint> points; ///< Ascending by register address, then function code
};

/**
 * @class RegisterMap
 * @brief Immutable directory from physical registers to entity columns.
 *
 * Built from the repository's active devices and mappings and replaced as a
 * whole after any change, so readers can share it without locking. Mappings
 * whose slave is not an active device are dropped.
 */
class RegisterMap {
public:
    RegisterMap() = default;

    /**
     * @brief Builds the map and its poll plan.
     * @param devices Devices to poll; inactive ones are skipped.
     * @param mappings Mappings to index.
     */
    RegisterMap(const std::vector<SlaveDevice>& devices, const std::vector<RegisterMapping>& mappings);

    /// @brief Devices ascending by address, each with its ordered points.
    const std::vector<DevicePlan>& plan() const { return device_plans; }

    std::optional<RegisterMapping> findMapping(int mapping_id) const;

    /// @brief All mappings feeding one entity, ordered by mapping id.
    std::vector<RegisterMapping> mappingsForEntity(EntityKind kind, int entity_id) const;

    /// @brief All mappings on one (slave, register) pair regardless of function code.
    std::vector<RegisterMapping> mappingsAt(int slave_address, int register_address) const;

    size_t deviceCount() const { return device_plans.size(); }
    size_t mappingCount() const { return by_id.size(); }

private:
    std::vector<DevicePlan> device_plans;
    std::unordered_map<int, RegisterMapping> by_id;
};

#endif // REGISTER_MAP_H
