#include "config_loader.hpp"
#include "sqlite_repository.hpp"
#include "terminal_service.hpp"
#include "transport_channel.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>

// Set by the signal handler, polled by the main loop
std::atomic<bool> g_shutdown_requested(false);

/**
 * @brief Asks the event loop in main() to stop polling and flush readings.
 * @param signum SIGINT or SIGTERM; not used.
 */
void signal_handler(int signum) {
    (void)signum;
    g_shutdown_requested = true;
}

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "terminal_profile.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }
    std::cout << "Loading configuration from: " << config_file << std::endl;

    Config config;
    try {
        config = ConfigLoader::loadConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration loaded successfully." << std::endl;

    // --- 2. Open the Database and Import the Site Profile ---
    SqliteRepository repository;
    if (repository.open(config.database_path) != RepositoryStatus::Ok) {
        std::cerr << "Failed to open database " << config.database_path << std::endl;
        return 1;
    }
    try {
        repository.importSite(config.site);
    } catch (const RepositoryError& e) {
        std::cerr << "Error importing site profile: " << e.what() << std::endl;
        return 1;
    }

    // --- 3. Wire the Polling Engine ---
    RtuTransportChannel channel;
    TerminalService service(repository, channel, config.polling);

    service.errorOccurred.connect([](const std::string& message) {
        std::cerr << "Error: " << message << std::endl;
    });
    service.modbusConnected.connect([](bool connected) {
        std::cout << "Modbus " << (connected ? "connected" : "disconnected") << std::endl;
    });
    service.weighbridges().currentWeightUpdated.connect([](int weighbridge_id, double weight) {
        std::cout << "Weighbridge " << weighbridge_id << ": " << weight << std::endl;
    });
    service.storageTanks().listUpdated.connect([&config](const std::vector<StorageTank>& tanks) {
        if (!config.polling.verbose) return;
        for (const auto& tank : tanks) {
            if (!tank.is_live) continue;
            std::cout << "Tank " << tank.name << ": volume " << tank.current_volume.value_or(0.0) << " "
                      << tank.unit_name << ", temperature " << tank.current_temperature.value_or(0.0) << std::endl;
        }
    });

    if (!service.attachDatabase()) {
        std::cerr << "Failed to load terminal data." << std::endl;
        return 1;
    }

    // --- 4. Connect to the Bus ---
    if (service.connect(config.serial) != ConnectionError::None) {
        std::cerr << "Failed to connect to Modbus on " << config.serial.port << "." << std::endl;
        return 1;
    }

    // --- 5. Set up Signal Handler and Run ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "\nTerminal poller is running. Press Ctrl+C to exit." << std::endl;

    while (!g_shutdown_requested) {
        service.processEvents(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    service.disconnect();
    service.persistReadings();
    return 0;
}
