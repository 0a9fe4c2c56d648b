#include "polling_loop.hpp"
#include <iostream>
#include <sstream>

PollingLoop::PollingLoop(TransportChannel& ch, ValueCache& value_cache, const PollingSettings& polling)
    : channel(ch), reader(ch), cache(value_cache), settings(polling),
      map(std::make_shared<const RegisterMap>()), running(false), cycles(0) {}

PollingLoop::~PollingLoop() {
    stop();
}

void PollingLoop::setRegisterMap(std::shared_ptr<const RegisterMap> new_map) {
    if (!new_map) {
        new_map = std::make_shared<const RegisterMap>();
    }
    std::lock_guard<std::mutex> lock(map_mutex);
    map = std::move(new_map);
}

std::shared_ptr<const RegisterMap> PollingLoop::registerMap() const {
    std::lock_guard<std::mutex> lock(map_mutex);
    return map;
}

bool PollingLoop::start() {
    if (running) return true;
    if (!channel.isOpen()) {
        std::cerr << "Cannot start polling: Modbus channel is not open" << std::endl;
        return false;
    }
    if (polling_thread.joinable()) {
        polling_thread.join();
    }
    running = true;
    polling_thread = std::thread(&PollingLoop::run, this);
    return true;
}

void PollingLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex);
        running = false;
    }
    wake_cv.notify_all();

    // A slot on the polling thread may ask for a stop; it cannot join itself
    if (polling_thread.joinable() && polling_thread.get_id() != std::this_thread::get_id()) {
        polling_thread.join();
    }
}

Snapshot PollingLoop::pollOnce() {
    std::shared_ptr<const RegisterMap> current = registerMap();
    Snapshot snapshot;
    std::vector<std::string> failures;

    for (const auto& device_plan : current->plan()) {
        int slave = device_plan.device.address;
        size_t read_count = 0;

        for (const auto& point : device_plan.points) {
            for (const auto& result : reader.readPoint(slave, point)) {
                if (!result.ok()) {
                    std::ostringstream msg;
                    msg << "slave " << slave << " register " << point.register_address
                        << " (mapping " << result.mapping_id << "): " << toString(result.error);
                    failures.push_back(msg.str());
                    continue;
                }
                cache.update(slave, result.mapping_id, {result.scaled, result.raw, result.timestamp});
                snapshot[{slave, result.mapping_id}] = result.scaled;
                ++read_count;
                if (settings.verbose) {
                    std::cout << "Read " << result.scaled << " (raw " << result.raw << ") from register "
                              << point.register_address << " of slave " << slave << std::endl;
                }
            }
        }

        if (settings.verbose) {
            std::cout << "Read " << read_count << " values from device " << device_plan.device.name
                      << " (address " << slave << ")" << std::endl;
        }
    }

    ++cycles;
    snapshotReady.emit(snapshot);

    if (!failures.empty()) {
        for (const auto& failure : failures) {
            std::cerr << "Modbus read error: " << failure << std::endl;
        }
        std::ostringstream msg;
        msg << "Modbus read error: " << failures.size() << " read(s) failed, first: " << failures.front();
        errorOccurred.emit(msg.str());
    }
    return snapshot;
}

void PollingLoop::run() {
    std::cout << "Modbus polling thread started." << std::endl;
    while (running) {
        pollOnce();

        // Full pause after every cycle, however long the reads took
        std::unique_lock<std::mutex> lock(wake_mutex);
        wake_cv.wait_for(lock, std::chrono::milliseconds(settings.cycle_interval_ms), [this] { return !running; });
    }
    std::cout << "Modbus polling thread stopped." << std::endl;
}
