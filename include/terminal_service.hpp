#ifndef TERMINAL_SERVICE_H
#define TERMINAL_SERVICE_H

#include "dispatch_queue.hpp"
#include "entity_projector.hpp"
#include "event_signal.hpp"
#include "polling_loop.hpp"
#include "terminal_repository.hpp"
#include "transport_channel.hpp"
#include "value_cache.hpp"
#include "weighing_station.hpp"
#include <chrono>
#include <string>

/**
 * @class TerminalService
 * @brief Wires the polling engine, the projectors and the weighing workflow together.
 *
 * Lifecycle:
 *  - attachDatabase() loads entities and mappings from the repository.
 *  - connect() opens the bus and starts polling.
 *  - processEvents() must be called regularly from the foreground thread; it
 *    delivers snapshots and errors raised by the polling thread and runs the
 *    timer that saves tank and loading arm readings. Only the newest pending
 *    snapshot is delivered; older ones still queued are dropped.
 *  - disconnect() stops polling before closing the bus.
 *
 * Everything except the polling thread itself runs on the thread that calls
 * processEvents().
 */
class TerminalService {
public:
    TerminalService(TerminalRepository& repository, TransportChannel& channel, const PollingSettings& settings);

    /**
     * @brief Destructor, disconnects from the bus.
     */
    ~TerminalService();

    TerminalService(const TerminalService&) = delete;
    TerminalService& operator=(const TerminalService&) = delete;

    /**
     * @brief Loads entities and the register map from the repository.
     * @return False if the repository could not be read.
     */
    bool attachDatabase();

    /// @brief Stops polling and forgets everything loaded from the repository.
    void detachDatabase();

    bool isAttached() const { return attached; }

    /**
     * @brief Opens the bus and starts polling.
     * @param params Serial line settings.
     * @return ConnectionError::None on success.
     */
    ConnectionError connect(const ConnectionParams& params);

    /// @brief Stops polling, then closes the bus. Safe to call when not connected.
    void disconnect();

    bool isConnected() const { return channel.isOpen() && loop.isRunning(); }

    /**
     * @brief Rebuilds the register map from the repository and hands it to the
     * loop and the projectors.
     * @return False if the repository could not be read.
     */
    bool refreshRegisterMap();

    // Device and mapping maintenance; the register map follows every successful change.
    RepositoryStatus addDevice(const SlaveDevice& device);
    RepositoryStatus updateDevice(const SlaveDevice& device);
    RepositoryStatus deleteDevice(int slave_address);
    RepositoryStatus setDeviceCommunicationStatus(int slave_address, bool active);
    RepositoryStatus addMapping(RegisterMapping& mapping);
    RepositoryStatus updateMapping(const RegisterMapping& mapping);
    RepositoryStatus deleteMapping(int mapping_id);

    /**
     * @brief Runs pending polling events on the calling thread.
     * @param max_wait How long to wait when nothing is pending.
     * @return Number of events handled.
     */
    size_t processEvents(std::chrono::milliseconds max_wait);

    /**
     * @brief Writes new cached storage tank and loading arm readings now.
     * @return Number of entities written.
     */
    size_t persistReadings();

    const ValueCache& valueCache() const { return cache; }
    PollingLoop& pollingLoop() { return loop; }
    StorageTankProjector& storageTanks() { return tank_projector; }
    LoadingArmProjector& loadingArms() { return arm_projector; }
    WeighbridgeProjector& weighbridges() { return weighbridge_projector; }
    WeighingStation& weighingStation() { return station; }

    Signal<const Snapshot&> dataUpdated;
    Signal<const std::string&> errorOccurred;
    Signal<bool> modbusConnected;

private:
    void onSnapshot(const Snapshot& snapshot);
    RepositoryStatus afterChange(RepositoryStatus status);
    void reportError(const std::string& message);

    TerminalRepository& repository;
    TransportChannel& channel;
    PollingSettings settings;

    ValueCache cache;
    DispatchQueue events;
    PollingLoop loop;
    StorageTankProjector tank_projector;
    LoadingArmProjector arm_projector;
    WeighbridgeProjector weighbridge_projector;
    WeighingStation station;

    bool attached;
    std::chrono::steady_clock::time_point last_persist;
};

#endif // TERMINAL_SERVICE_H
