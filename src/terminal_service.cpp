#include "terminal_service.hpp"
#include <iostream>

TerminalService::TerminalService(TerminalRepository& repo, TransportChannel& ch, const PollingSettings& polling)
    : repository(repo), channel(ch), settings(polling), loop(ch, cache, polling), station(repo),
      attached(false), last_persist(std::chrono::steady_clock::now()) {
    // Polling thread -> foreground thread; a newer snapshot replaces one still pending
    loop.snapshotReady.connect([this](const Snapshot& snapshot) {
        events.postLatest("snapshot", [this, snapshot] { onSnapshot(snapshot); });
    });
    loop.errorOccurred.connect([this](const std::string& message) {
        events.post([this, message] { errorOccurred.emit(message); });
    });

    // Foreground wiring
    weighbridge_projector.currentWeightUpdated.connect([this](int weighbridge_id, double weight) {
        station.onCurrentWeight(weighbridge_id, weight);
    });
    station.weighingUpdated.connect([this](const WeighingSession& session) {
        weighbridge_projector.onWeighingUpdated(session);
    });
    station.weighingCancelled.connect([this](int weighbridge_id) {
        weighbridge_projector.onWeighingCancelled(weighbridge_id);
    });
    station.errorOccurred.connect([this](const std::string& message) { errorOccurred.emit(message); });
    tank_projector.errorOccurred.connect([this](const std::string& message) { errorOccurred.emit(message); });
    arm_projector.errorOccurred.connect([this](const std::string& message) { errorOccurred.emit(message); });
}

TerminalService::~TerminalService() {
    disconnect();
    events.clear();
}

void TerminalService::reportError(const std::string& message) {
    std::cerr << message << std::endl;
    errorOccurred.emit(message);
}

bool TerminalService::attachDatabase() {
    try {
        tank_projector.setEntities(repository.listStorageTanks());
        arm_projector.setEntities(repository.listLoadingArms());
        weighbridge_projector.setEntities(repository.listWeighbridges());
    } catch (const RepositoryError& e) {
        reportError(std::string("Error connecting to database: ") + e.what());
        return false;
    }
    attached = true;
    if (!refreshRegisterMap()) {
        attached = false;
        return false;
    }
    std::cout << "Loaded " << tank_projector.entities().size() << " storage tank(s), "
              << arm_projector.entities().size() << " loading arm(s) and "
              << weighbridge_projector.entities().size() << " weighbridge(s)." << std::endl;
    return true;
}

void TerminalService::detachDatabase() {
    disconnect();
    attached = false;
    tank_projector.setEntities({});
    arm_projector.setEntities({});
    weighbridge_projector.setEntities({});

    auto empty = std::make_shared<const RegisterMap>();
    loop.setRegisterMap(empty);
    tank_projector.setRegisterMap(empty);
    arm_projector.setRegisterMap(empty);
    weighbridge_projector.setRegisterMap(empty);
}

ConnectionError TerminalService::connect(const ConnectionParams& params) {
    ConnectionError result = channel.open(params);
    if (result != ConnectionError::None) {
        reportError(std::string("Failed to connect to Modbus device: ") + toString(result));
        if (result != ConnectionError::AlreadyOpen) {
            modbusConnected.emit(false);
        }
        return result;
    }

    if (attached) {
        refreshRegisterMap();
    }
    if (!loop.start()) {
        channel.close();
        reportError("Failed to start Modbus polling");
        modbusConnected.emit(false);
        return ConnectionError::OpenFailed;
    }
    modbusConnected.emit(true);
    return ConnectionError::None;
}

void TerminalService::disconnect() {
    bool was_open = channel.isOpen();
    loop.stop();
    channel.close();
    if (was_open) {
        std::cout << "Modbus connection closed." << std::endl;
        modbusConnected.emit(false);
    }
}

bool TerminalService::refreshRegisterMap() {
    if (!attached) return false;

    std::shared_ptr<const RegisterMap> map;
    try {
        map = std::make_shared<const RegisterMap>(repository.listActiveDevices(), repository.listActiveMappings());
    } catch (const RepositoryError& e) {
        reportError(std::string("Failed to fetch register mappings: ") + e.what());
        return false;
    }

    loop.setRegisterMap(map);
    tank_projector.setRegisterMap(map);
    arm_projector.setRegisterMap(map);
    weighbridge_projector.setRegisterMap(map);
    std::cout << "Register map loaded: " << map->deviceCount() << " device(s), " << map->mappingCount()
              << " mapping(s)." << std::endl;
    return true;
}

RepositoryStatus TerminalService::afterChange(RepositoryStatus status) {
    if (status == RepositoryStatus::Ok) {
        refreshRegisterMap();
    } else {
        errorOccurred.emit(std::string("Repository change rejected: ") + toString(status));
    }
    return status;
}

RepositoryStatus TerminalService::addDevice(const SlaveDevice& device) {
    return afterChange(repository.addDevice(device));
}

RepositoryStatus TerminalService::updateDevice(const SlaveDevice& device) {
    return afterChange(repository.updateDevice(device));
}

RepositoryStatus TerminalService::deleteDevice(int slave_address) {
    return afterChange(repository.deleteDevice(slave_address));
}

RepositoryStatus TerminalService::setDeviceCommunicationStatus(int slave_address, bool active) {
    return afterChange(repository.setDeviceCommunicationStatus(slave_address, active));
}

RepositoryStatus TerminalService::addMapping(RegisterMapping& mapping) {
    return afterChange(repository.addMapping(mapping));
}

RepositoryStatus TerminalService::updateMapping(const RegisterMapping& mapping) {
    return afterChange(repository.updateMapping(mapping));
}

RepositoryStatus TerminalService::deleteMapping(int mapping_id) {
    return afterChange(repository.deleteMapping(mapping_id));
}

void TerminalService::onSnapshot(const Snapshot& snapshot) {
    tank_projector.onSnapshot(snapshot);
    arm_projector.onSnapshot(snapshot);
    weighbridge_projector.onSnapshot(snapshot);
    dataUpdated.emit(snapshot);
}

size_t TerminalService::processEvents(std::chrono::milliseconds max_wait) {
    size_t handled = events.dispatch(max_wait);

    auto now = std::chrono::steady_clock::now();
    if (attached && now - last_persist >= std::chrono::milliseconds(settings.persist_interval_ms)) {
        last_persist = now;
        persistReadings();
    }
    return handled;
}

size_t TerminalService::persistReadings() {
    if (!attached) return 0;
    size_t tanks = tank_projector.persist(repository, cache);
    size_t arms = arm_projector.persist(repository, cache);
    if (settings.verbose && tanks + arms > 0) {
        std::cout << "Saved readings of " << tanks << " storage tank(s) and " << arms << " loading arm(s)."
                  << std::endl;
    }
    return tanks + arms;
}
