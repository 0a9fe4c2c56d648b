#include "weighing_station.hpp"
#include <iostream>

WeighingStation::WeighingStation(TerminalRepository& repo) : repository(repo) {}

WeighingError WeighingStation::fail(WeighingError error, const std::string& message) {
    std::cerr << "Weighing error (" << toString(error) << "): " << message << std::endl;
    errorOccurred.emit(message);
    return error;
}

WeighingError WeighingStation::startWeighing(int weighbridge_id, int order_id, int driver_id,
                                             const std::string& vehicle_license) {
    if (sessions.count(weighbridge_id) > 0) {
        return fail(WeighingError::SessionAlreadyActive,
                    "Weighbridge " + std::to_string(weighbridge_id) + " already has an active weighing");
    }

    try {
        // --- 1. The order must still be open ---
        auto order = repository.getOrder(order_id);
        if (!order || (order->status != OrderStatus::Pending && order->status != OrderStatus::Ready &&
                       order->status != OrderStatus::InProgress)) {
            return fail(WeighingError::OrderNotAvailable,
                        "Order " + std::to_string(order_id) + " not found or not in valid status");
        }

        // --- 2. Claim it; zero rows means it changed under us ---
        if (repository.claimOrderForWeighing(order_id, weighbridge_id, driver_id, vehicle_license) != 1) {
            return fail(WeighingError::PersistenceError, "Failed to update order " + std::to_string(order_id));
        }
    } catch (const RepositoryError& e) {
        return fail(WeighingError::PersistenceError, std::string("Error starting new weighing: ") + e.what());
    }

    // --- 3. Open the session ---
    WeighingSession session;
    session.weighbridge_id = weighbridge_id;
    session.order_id = order_id;
    session.driver_id = driver_id;
    session.vehicle_license = vehicle_license;
    auto weight = current_weights.find(weighbridge_id);
    if (weight != current_weights.end()) {
        session.current_weight = weight->second;
    }
    sessions[weighbridge_id] = session;

    std::cout << "Weighing of order " << order_id << " started on weighbridge " << weighbridge_id << std::endl;
    weighingUpdated.emit(session);
    return WeighingError::None;
}

WeighingError WeighingStation::setTare(int weighbridge_id) {
    auto it = sessions.find(weighbridge_id);
    if (it == sessions.end()) {
        return fail(WeighingError::NoActiveSession,
                    "No active weighing for weighbridge " + std::to_string(weighbridge_id));
    }
    auto weight = current_weights.find(weighbridge_id);
    if (weight == current_weights.end()) {
        return fail(WeighingError::NoCurrentReading,
                    "No current weight reading available for weighbridge " + std::to_string(weighbridge_id));
    }

    it->second.tare_weight = weight->second;
    it->second.current_weight = weight->second;
    weighingUpdated.emit(it->second);
    return WeighingError::None;
}

WeighingError WeighingStation::setGross(int weighbridge_id) {
    auto it = sessions.find(weighbridge_id);
    if (it == sessions.end()) {
        return fail(WeighingError::NoActiveSession,
                    "No active weighing for weighbridge " + std::to_string(weighbridge_id));
    }
    if (!it->second.tare_weight) {
        return fail(WeighingError::TareNotSet, "Tare weight must be set before gross weight");
    }
    auto weight = current_weights.find(weighbridge_id);
    if (weight == current_weights.end()) {
        return fail(WeighingError::NoCurrentReading,
                    "No current weight reading available for weighbridge " + std::to_string(weighbridge_id));
    }

    // --- 1. Work on a copy so a failed write leaves the session untouched ---
    WeighingSession completed = it->second;
    completed.current_weight = weight->second;
    completed.gross_weight = weight->second;
    completed.net_weight = weight->second - *completed.tare_weight;
    completed.status = WeighingStatus::Completed;

    // --- 2. Persist, then close the session ---
    try {
        if (repository.completeWeighing(completed) != 1) {
            return fail(WeighingError::PersistenceError,
                        "Failed to store weighing of order " + std::to_string(completed.order_id));
        }
    } catch (const RepositoryError& e) {
        return fail(WeighingError::PersistenceError, std::string("Error storing completed weighing: ") + e.what());
    }

    sessions.erase(it);
    std::cout << "Weighing of order " << completed.order_id << " completed: net " << *completed.net_weight
              << std::endl;
    weighingUpdated.emit(completed);
    return WeighingError::None;
}

WeighingError WeighingStation::cancelWeighing(int weighbridge_id) {
    auto it = sessions.find(weighbridge_id);
    if (it == sessions.end()) {
        return fail(WeighingError::NoActiveSession,
                    "No active weighing for weighbridge " + std::to_string(weighbridge_id));
    }
    sessions.erase(it);
    std::cout << "Weighing on weighbridge " << weighbridge_id << " cancelled" << std::endl;
    weighingCancelled.emit(weighbridge_id);
    return WeighingError::None;
}

void WeighingStation::onCurrentWeight(int weighbridge_id, double weight) {
    current_weights[weighbridge_id] = weight;
    auto it = sessions.find(weighbridge_id);
    if (it != sessions.end()) {
        it->second.current_weight = weight;
        weighingUpdated.emit(it->second);
    }
}

std::optional<WeighingSession> WeighingStation::activeSession(int weighbridge_id) const {
    auto it = sessions.find(weighbridge_id);
    if (it != sessions.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> WeighingStation::currentWeight(int weighbridge_id) const {
    auto it = current_weights.find(weighbridge_id);
    if (it != current_weights.end()) {
        return it->second;
    }
    return std::nullopt;
}
