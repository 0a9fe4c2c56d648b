#ifndef POLLING_LOOP_H
#define POLLING_LOOP_H

#include "event_signal.hpp"
#include "register_map.hpp"
#include "register_reader.hpp"
#include "transport_channel.hpp"
#include "value_cache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @class PollingLoop
 * @brief Reads every mapped register of every active slave in a dedicated thread.
 *
 * One cycle visits devices ascending by address and, per device, points
 * ascending by register address. Successful reads go to the ValueCache and to
 * the cycle's snapshot; failures are logged and skipped. At the end of the
 * cycle snapshotReady fires with the whole snapshot, and errorOccurred fires
 * once if anything failed. Signals are emitted on the polling thread.
 * The thread then pauses for the full cycle interval before the next cycle.
 */
class PollingLoop {
public:
    /**
     * @brief Constructor for the PollingLoop.
     * @param channel The bus. Only this loop may use it while running.
     * @param cache Where successful reads are stored.
     * @param settings Cycle interval and verbosity.
     */
    PollingLoop(TransportChannel& channel, ValueCache& cache, const PollingSettings& settings);

    /**
     * @brief Destructor, ensures the thread is stopped.
     */
    ~PollingLoop();

    PollingLoop(const PollingLoop&) = delete;
    PollingLoop& operator=(const PollingLoop&) = delete;

    /**
     * @brief Replaces the register map. A cycle in progress keeps the map it started with.
     */
    void setRegisterMap(std::shared_ptr<const RegisterMap> map);

    std::shared_ptr<const RegisterMap> registerMap() const;

    /**
     * @brief Starts the polling thread.
     * @return False if the channel is not open; true if running afterwards.
     */
    bool start();

    /**
     * @brief Asks the loop to finish its current cycle and waits for the thread.
     *
     * No read is in flight once this returns.
     */
    void stop();

    bool isRunning() const { return running; }

    /**
     * @brief Runs one full cycle on the calling thread.
     * @return The values read successfully in this cycle.
     */
    Snapshot pollOnce();

    uint64_t cycleCount() const { return cycles; }

    Signal<const Snapshot&> snapshotReady;
    Signal<const std::string&> errorOccurred;

private:
    /**
     * @brief The main loop of the polling thread.
     */
    void run();

    TransportChannel& channel;
    RegisterReader reader;
    ValueCache& cache;
    PollingSettings settings;

    mutable std::mutex map_mutex;
    std::shared_ptr<const RegisterMap> map;

    std::thread polling_thread;
    std::atomic<bool> running;
    std::atomic<uint64_t> cycles;
    std::mutex wake_mutex;
    std::condition_variable wake_cv;
};

#endif // POLLING_LOOP_H
