#ifndef TERMINAL_REPOSITORY_H
#define TERMINAL_REPOSITORY_H

#include "terminal_errors.hpp"
#include "terminal_model.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @class TerminalRepository
 * @brief Persistent store of devices, mappings, entities and orders.
 *
 * Queries throw RepositoryError when the database cannot answer. Mutations
 * report their outcome as a RepositoryStatus; ValidationError means nothing
 * was changed.
 */
class TerminalRepository {
public:
    virtual ~TerminalRepository() = default;

    // --- Device registry ---
    virtual std::vector<SlaveDevice> listActiveDevices() = 0;
    virtual std::optional<SlaveDevice> getDevice(int slave_address) = 0;
    virtual RepositoryStatus addDevice(const SlaveDevice& device) = 0;
    virtual RepositoryStatus updateDevice(const SlaveDevice& device) = 0;
    /// @brief Soft delete; the device and its mappings stop being polled.
    virtual RepositoryStatus deleteDevice(int slave_address) = 0;
    virtual RepositoryStatus setDeviceCommunicationStatus(int slave_address, bool active) = 0;

    // --- Mapping repository ---
    /// @brief Mappings of active devices, ordered by slave then register address.
    virtual std::vector<RegisterMapping> listActiveMappings() = 0;
    virtual std::optional<RegisterMapping> getMapping(int mapping_id) = 0;
    /**
     * @brief Stores a new mapping.
     * @param mapping The mapping; its mapping_id is assigned on success.
     */
    virtual RepositoryStatus addMapping(RegisterMapping& mapping) = 0;
    virtual RepositoryStatus updateMapping(const RegisterMapping& mapping) = 0;
    virtual RepositoryStatus deleteMapping(int mapping_id) = 0;

    // --- Entities ---
    virtual std::vector<StorageTank> listStorageTanks() = 0;
    virtual std::vector<LoadingArm> listLoadingArms() = 0;
    virtual std::vector<Weighbridge> listWeighbridges() = 0;

    /**
     * @brief Writes live columns of one entity and stamps its last reading time.
     * @param kind Entity table.
     * @param entity_id Row id.
     * @param fields Column name (as used in mappings) to value.
     * @param read_at When the newest of these values was read from the bus.
     * @return Number of rows changed; 0 if the entity does not exist.
     */
    virtual int updateEntityFields(EntityKind kind, int entity_id, const std::map<std::string, double>& fields,
                                   Timestamp read_at) = 0;

    // --- Orders used by the weighing workflow ---
    virtual std::optional<Order> getOrder(int order_id) = 0;
    /// @brief Orders that can still be weighed (Pending, Ready, InProgress), newest first.
    virtual std::vector<Order> listOpenOrders() = 0;

    /**
     * @brief Marks an order InProgress on a weighbridge if it is still open.
     * @return Number of rows changed; 0 if another session got there first.
     */
    virtual int claimOrderForWeighing(int order_id, int weighbridge_id, int driver_id,
                                      const std::string& vehicle_license) = 0;

    /**
     * @brief Stores tare, gross and net of a session and marks the order Completed.
     * @return Number of rows changed.
     */
    virtual int completeWeighing(const WeighingSession& session) = 0;

    // --- History ---
    virtual void recordHistoricalValue(int mapping_id, double value, Timestamp at) = 0;
    virtual std::vector<HistoricalValue> listHistory(int mapping_id) = 0;
};

#endif // TERMINAL_REPOSITORY_H
