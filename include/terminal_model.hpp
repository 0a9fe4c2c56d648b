#ifndef TERMINAL_MODEL_H
#define TERMINAL_MODEL_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// @brief Modbus data tables a mapping can address.
enum class RegisterType {
    Coil,            ///< Function code 1
    DiscreteInput,   ///< Function code 2
    HoldingRegister, ///< Function code 3
    InputRegister    ///< Function code 4
};

/// @brief Domain tables a register can be mapped onto.
enum class EntityKind {
    StorageTank,
    LoadingArm,
    Weighbridge
};

/// @brief Lifecycle of a loading order as far as the weighbridge cares.
enum class OrderStatus {
    Pending,
    Ready,
    InProgress,
    Completed,
    Cancelled
};

/// @brief State of a weighing session.
enum class WeighingStatus {
    InProgress,
    Completed
};

/**
 * @struct ConnectionParams
 * @brief Serial line settings for the RTU bus.
 */
struct ConnectionParams {
    std::string port = "/dev/ttyUSB0";
    int baudrate = 9600;
    char parity = 'N';
    int stopbits = 1;
    int bytesize = 8;
    double timeout = 1.0; // seconds
};

/**
 * @struct SlaveDevice
 * @brief A field device on the RTU bus. Identity is the slave address.
 */
struct SlaveDevice {
    int address = 0;
    std::string name;
    int baudrate = 9600;
    std::string port;
    int data_bits = 8;
    char parity = 'N';
    int stop_bits = 1;
    bool active = true;
};

/**
 * @struct RegisterMapping
 * @brief Binds one physical register of a slave to a column of a domain entity.
 *
 * Several mappings may point at the same (slave, register) pair; the mapping id
 * is what the value cache is keyed on.
 */
struct RegisterMapping {
    int mapping_id = 0;
    int slave_address = 0;
    int register_address = 0;
    RegisterType register_type = RegisterType::HoldingRegister;
    int function_code = 3;
    EntityKind entity_kind = EntityKind::StorageTank;
    int entity_id = 0;
    std::string column;
    double scale_factor = 1.0;
    double offset = 0.0;
    bool store_historical = false;
    bool read_only = true;
};

/// @brief Key of the value cache and of snapshots: (slave address, mapping id).
using ValueKey = std::pair<int, int>;

/// @brief One poll cycle worth of freshly read values.
using Snapshot = std::map<ValueKey, double>;

/**
 * @struct StorageTank
 * @brief Storage tank record. The current_* fields are only written by a projector.
 */
struct StorageTank {
    int id = 0;
    std::string name;
    std::string product_name;
    std::string owner_name;
    double total_volume = 0.0;
    std::string unit_name;
    std::optional<double> current_volume;
    std::optional<double> current_mass;
    std::optional<double> current_temperature;
    bool is_live = false;
    std::optional<Timestamp> last_reading;
};

/**
 * @struct LoadingArm
 * @brief Loading arm record with its live flow reading.
 *
 * loading_weight is the configured capacity of the arm; the polled weight
 * goes to current_loading_weight.
 */
struct LoadingArm {
    int id = 0;
    std::string code;
    std::string name;
    double loading_weight = 0.0;
    std::string unit_name;
    double flow_rate = 0.0;
    double current_loading_weight = 0.0;
    bool is_active = false;
    std::optional<Timestamp> last_reading;
};

/**
 * @struct Weighbridge
 * @brief Weighbridge record. Tare and gross mirror the active weighing session.
 */
struct Weighbridge {
    int id = 0;
    std::string code;
    std::string name;
    bool enabled = true;
    double current_weight = 0.0;
    bool has_reading = false;
    std::optional<double> tare_weight;
    std::optional<double> gross_weight;
    std::optional<Timestamp> last_reading;
};

/**
 * @struct Order
 * @brief The part of a loading order that the weighing workflow reads and writes.
 */
struct Order {
    int order_id = 0;
    std::string product_name;
    OrderStatus status = OrderStatus::Pending;
    double planned_quantity = 0.0;
    std::optional<int> weighbridge_id;
    std::optional<int> driver_id;
    std::string vehicle_license;
    std::optional<double> initial_weight;
    std::optional<double> final_weight;
    std::optional<double> actual_quantity;
};

/**
 * @struct WeighingSession
 * @brief An active weighing on one weighbridge.
 */
struct WeighingSession {
    int weighbridge_id = 0;
    int order_id = 0;
    int driver_id = 0;
    std::string vehicle_license;
    double current_weight = 0.0;
    std::optional<double> tare_weight;
    std::optional<double> gross_weight;
    std::optional<double> net_weight;
    WeighingStatus status = WeighingStatus::InProgress;
};

/// @brief A persisted reading of a mapping flagged store_historical.
struct HistoricalValue {
    int mapping_id = 0;
    double value = 0.0;
    Timestamp recorded_at;
};

/**
 * @struct PollingSettings
 * @brief Timing of the poll loop and of the persistence timer.
 */
struct PollingSettings {
    int cycle_interval_ms = 100;
    int persist_interval_ms = 10000;
    bool verbose = false;
};

/**
 * @struct SiteProfile
 * @brief Seed data imported into the repository at startup.
 */
struct SiteProfile {
    std::vector<SlaveDevice> devices;
    std::vector<RegisterMapping> mappings;
    std::vector<StorageTank> storage_tanks;
    std::vector<LoadingArm> loading_arms;
    std::vector<Weighbridge> weighbridges;
    std::vector<Order> orders;
};

/**
 * @struct Config
 * @brief Top-level structure to hold the entire parsed configuration.
 */
struct Config {
    ConnectionParams serial;
    std::string database_path = "terminal.db";
    PollingSettings polling;
    SiteProfile site;
};

// Conversions between enums and their configuration/database spelling.
std::string toString(RegisterType type);
std::string toString(EntityKind kind);
std::string toString(OrderStatus status);
std::optional<RegisterType> parseRegisterType(const std::string& s);
std::optional<EntityKind> parseEntityKind(const std::string& s);
std::optional<OrderStatus> parseOrderStatus(const std::string& s);

/// @brief The only function code that can read a given register type.
int functionCodeFor(RegisterType type);

/// @brief Columns of an entity kind that may be fed from a register.
const std::vector<std::string>& mappableColumns(EntityKind kind);

/// @brief Column whose presence in a snapshot marks an entity as live.
const std::string& livenessColumn(EntityKind kind);

bool isMappableColumn(EntityKind kind, const std::string& column);

/**
 * @brief Checks serial parameters against what the bus supports.
 * @param params The parameters to check.
 * @param reason Filled with a human readable reason on failure.
 * @return True if the parameters are usable.
 */
bool validateConnectionParams(const ConnectionParams& params, std::string& reason);

/// @brief Checks a device definition before it is stored.
bool validateDevice(const SlaveDevice& device, std::string& reason);

/// @brief Checks a mapping definition in isolation (no foreign keys).
bool validateMapping(const RegisterMapping& mapping, std::string& reason);

#endif // TERMINAL_MODEL_H
