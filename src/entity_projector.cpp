#include "entity_projector.hpp"
#include <iostream>

// --- Storage tanks ---

StorageTankProjector::StorageTankProjector() : EntityProjector<StorageTank>(EntityKind::StorageTank) {}

void StorageTankProjector::applyColumn(StorageTank& tank, const RegisterMapping& mapping, double value) {
    if (mapping.column == "CurrentVolume") {
        tank.current_volume = value;
    } else if (mapping.column == "CurrentMass") {
        tank.current_mass = value;
    } else if (mapping.column == "CurrentTemperature") {
        tank.current_temperature = value;
    }
}

void StorageTankProjector::setLive(StorageTank& tank, bool live, Timestamp at) {
    tank.is_live = live;
    if (live) {
        tank.last_reading = at;
    }
}

size_t StorageTankProjector::persist(TerminalRepository& repository, const ValueCache& cache) {
    return persistReadings(repository, cache, "storage tank");
}

// --- Loading arms ---

LoadingArmProjector::LoadingArmProjector() : EntityProjector<LoadingArm>(EntityKind::LoadingArm) {}

void LoadingArmProjector::applyColumn(LoadingArm& arm, const RegisterMapping& mapping, double value) {
    if (mapping.column == "FlowRate") {
        arm.flow_rate = value;
    } else if (mapping.column == "LoadingWeight") {
        arm.current_loading_weight = value;
    }
}

size_t LoadingArmProjector::persist(TerminalRepository& repository, const ValueCache& cache) {
    return persistReadings(repository, cache, "loading arm");
}

void LoadingArmProjector::setLive(LoadingArm& arm, bool live, Timestamp at) {
    arm.is_active = live;
    if (live) {
        arm.last_reading = at;
    }
}

// --- Weighbridges ---

WeighbridgeProjector::WeighbridgeProjector() : EntityProjector<Weighbridge>(EntityKind::Weighbridge) {}

void WeighbridgeProjector::applyColumn(Weighbridge& weighbridge, const RegisterMapping& mapping, double value) {
    if (mapping.column != "CurrentWeight") return;
    weighbridge.current_weight = value;
    currentWeightUpdated.emit(weighbridge.id, value);
}

void WeighbridgeProjector::setLive(Weighbridge& weighbridge, bool live, Timestamp at) {
    weighbridge.has_reading = live;
    if (live) {
        weighbridge.last_reading = at;
    }
}

void WeighbridgeProjector::onWeighingUpdated(const WeighingSession& session) {
    Weighbridge* weighbridge = findMutable(session.weighbridge_id);
    if (weighbridge == nullptr) return;
    weighbridge->tare_weight = session.tare_weight;
    weighbridge->gross_weight = session.gross_weight;
    listUpdated.emit(tracked);
}

void WeighbridgeProjector::onWeighingCancelled(int weighbridge_id) {
    Weighbridge* weighbridge = findMutable(weighbridge_id);
    if (weighbridge == nullptr) return;
    weighbridge->tare_weight.reset();
    weighbridge->gross_weight.reset();
    listUpdated.emit(tracked);
}
