#ifndef WEIGHING_STATION_H
#define WEIGHING_STATION_H

#include "event_signal.hpp"
#include "terminal_errors.hpp"
#include "terminal_repository.hpp"
#include <map>
#include <optional>
#include <string>

/**
 * @class WeighingStation
 * @brief Tare / gross / net weighing sessions, at most one per weighbridge.
 *
 * Current weights arrive through onCurrentWeight(), normally connected to
 * WeighbridgeProjector::currentWeightUpdated. Every failed operation returns
 * its WeighingError and also emits errorOccurred; a failed operation never
 * changes the session.
 *
 * Not thread-safe; used on the foreground thread only.
 */
class WeighingStation {
public:
    explicit WeighingStation(TerminalRepository& repository);

    /**
     * @brief Claims an order for a weighbridge and opens a session.
     * @param weighbridge_id Weighbridge the truck stands on.
     * @param order_id Order being loaded; must be Pending, Ready or InProgress.
     * @param driver_id Driver of the truck.
     * @param vehicle_license License plate of the truck.
     * @return WeighingError::None on success.
     */
    WeighingError startWeighing(int weighbridge_id, int order_id, int driver_id, const std::string& vehicle_license);

    /// @brief Captures the current weight as tare.
    WeighingError setTare(int weighbridge_id);

    /**
     * @brief Captures the current weight as gross, stores the result and closes the session.
     *
     * The session is removed only after the order was updated; on a
     * persistence failure it stays InProgress as it was.
     */
    WeighingError setGross(int weighbridge_id);

    /// @brief Discards the session of a weighbridge.
    WeighingError cancelWeighing(int weighbridge_id);

    /// @brief Latest weight reading of a weighbridge.
    void onCurrentWeight(int weighbridge_id, double weight);

    std::optional<WeighingSession> activeSession(int weighbridge_id) const;
    std::optional<double> currentWeight(int weighbridge_id) const;
    size_t activeSessionCount() const { return sessions.size(); }

    Signal<const WeighingSession&> weighingUpdated;
    Signal<int> weighingCancelled;
    Signal<const std::string&> errorOccurred;

private:
    WeighingError fail(WeighingError error, const std::string& message);

    TerminalRepository& repository;
    std::map<int, WeighingSession> sessions;
    std::map<int, double> current_weights;
};

#endif // WEIGHING_STATION_H
