#include "sqlite_repository.hpp"
#include <sqlite3.h>
#include <iostream>

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS modbus_device (
    slave_address   INTEGER PRIMARY KEY,
    slave_name      TEXT    NOT NULL,
    baudrate        INTEGER NOT NULL,
    port            TEXT    NOT NULL DEFAULT '',
    data_bits       INTEGER NOT NULL,
    parity          TEXT    NOT NULL,
    stop_bits       INTEGER NOT NULL,
    is_active       INTEGER NOT NULL DEFAULT 1,
    is_deleted      INTEGER NOT NULL DEFAULT 0,
    modified_at     INTEGER
);
CREATE UNIQUE INDEX IF NOT EXISTS ux_modbus_device_name
    ON modbus_device(slave_name) WHERE is_deleted = 0;

CREATE TABLE IF NOT EXISTS register_mapping (
    mapping_id       INTEGER PRIMARY KEY AUTOINCREMENT,
    slave_address    INTEGER NOT NULL REFERENCES modbus_device(slave_address),
    register_address INTEGER NOT NULL,
    register_type    TEXT    NOT NULL,
    function_code    INTEGER NOT NULL,
    mapped_table     TEXT    NOT NULL,
    mapped_entity_id INTEGER NOT NULL,
    mapped_column    TEXT    NOT NULL,
    scale_factor     REAL    NOT NULL DEFAULT 1,
    offset_value     REAL    NOT NULL DEFAULT 0,
    store_historical INTEGER NOT NULL DEFAULT 0,
    is_read_only     INTEGER NOT NULL DEFAULT 1,
    is_deleted       INTEGER NOT NULL DEFAULT 0,
    modified_at      INTEGER
);

CREATE TABLE IF NOT EXISTS storage_tank (
    storage_tank_id     INTEGER PRIMARY KEY,
    storage_tank_name   TEXT NOT NULL,
    product_name        TEXT NOT NULL DEFAULT '',
    owner_name          TEXT NOT NULL DEFAULT '',
    total_volume        REAL NOT NULL DEFAULT 0,
    unit_name           TEXT NOT NULL DEFAULT '',
    current_volume      REAL,
    current_mass        REAL,
    current_temperature REAL,
    last_reading_at     INTEGER,
    is_deleted          INTEGER NOT NULL DEFAULT 0
);
CREATE UNIQUE INDEX IF NOT EXISTS ux_storage_tank_name
    ON storage_tank(storage_tank_name) WHERE is_deleted = 0;

CREATE TABLE IF NOT EXISTS loading_arm (
    loading_arm_id   INTEGER PRIMARY KEY,
    loading_arm_code TEXT NOT NULL,
    loading_arm_name TEXT NOT NULL,
    loading_weight   REAL NOT NULL DEFAULT 0,
    unit_name        TEXT NOT NULL DEFAULT '',
    flow_rate        REAL,
    current_loading_weight REAL,
    last_reading_at  INTEGER,
    is_deleted       INTEGER NOT NULL DEFAULT 0
);
CREATE UNIQUE INDEX IF NOT EXISTS ux_loading_arm_code
    ON loading_arm(loading_arm_code) WHERE is_deleted = 0;

CREATE TABLE IF NOT EXISTS weighbridge (
    weighbridge_id   INTEGER PRIMARY KEY,
    weighbridge_code TEXT NOT NULL,
    weighbridge_name TEXT NOT NULL,
    is_active        INTEGER NOT NULL DEFAULT 1,
    current_weight   REAL,
    last_reading_at  INTEGER,
    is_deleted       INTEGER NOT NULL DEFAULT 0
);
CREATE UNIQUE INDEX IF NOT EXISTS ux_weighbridge_code
    ON weighbridge(weighbridge_code) WHERE is_deleted = 0;

CREATE TABLE IF NOT EXISTS orders (
    order_id             INTEGER PRIMARY KEY,
    product_name         TEXT NOT NULL DEFAULT '',
    status               TEXT NOT NULL,
    planned_quantity     REAL NOT NULL DEFAULT 0,
    weighbridge_id       INTEGER,
    driver_id            INTEGER,
    vehicle_license      TEXT NOT NULL DEFAULT '',
    initial_weight       REAL,
    final_weight         REAL,
    actual_quantity      REAL,
    loading_started_at   INTEGER,
    loading_completed_at INTEGER,
    is_deleted           INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS register_history (
    history_id  INTEGER PRIMARY KEY AUTOINCREMENT,
    mapping_id  INTEGER NOT NULL,
    value       REAL    NOT NULL,
    recorded_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS ix_register_history_mapping
    ON register_history(mapping_id, recorded_at);
)SQL";

int64_t toEpochMs(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp fromEpochMs(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @class Statement
 * @brief RAII wrapper of a prepared statement. Errors become RepositoryError.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db(db), stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw RepositoryError(RepositoryStatus::PersistenceError,
                                  std::string("Error preparing query: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int value) { check(sqlite3_bind_int(stmt, index, value)); }
    void bind(int index, int64_t value) { check(sqlite3_bind_int64(stmt, index, value)); }
    void bind(int index, double value) { check(sqlite3_bind_double(stmt, index, value)); }
    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bindNull(int index) { check(sqlite3_bind_null(stmt, index)); }

    template <typename T>
    void bind(int index, const std::optional<T>& value) {
        if (value) {
            bind(index, *value);
        } else {
            bindNull(index);
        }
    }

    /**
     * @brief Advances the statement.
     * @return True if a row is available, false when done.
     */
    bool step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        RepositoryStatus status = ((rc & 0xff) == SQLITE_CONSTRAINT) ? RepositoryStatus::ValidationError
                                                                     : RepositoryStatus::PersistenceError;
        throw RepositoryError(status, std::string("Error executing query: ") + sqlite3_errmsg(db));
    }

    /// @brief Runs a statement that returns no rows.
    int execute() {
        step();
        return sqlite3_changes(db);
    }

    bool isNull(int col) const { return sqlite3_column_type(stmt, col) == SQLITE_NULL; }
    int columnInt(int col) const { return sqlite3_column_int(stmt, col); }
    int64_t columnInt64(int col) const { return sqlite3_column_int64(stmt, col); }
    double columnDouble(int col) const { return sqlite3_column_double(stmt, col); }
    std::string columnText(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }
    std::optional<double> columnOptionalDouble(int col) const {
        if (isNull(col)) return std::nullopt;
        return columnDouble(col);
    }
    std::optional<int> columnOptionalInt(int col) const {
        if (isNull(col)) return std::nullopt;
        return columnInt(col);
    }
    std::optional<Timestamp> columnOptionalTime(int col) const {
        if (isNull(col)) return std::nullopt;
        return fromEpochMs(columnInt64(col));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw RepositoryError(RepositoryStatus::PersistenceError,
                                  std::string("Error binding parameter: ") + sqlite3_errmsg(db));
        }
    }

    sqlite3* db;
    sqlite3_stmt* stmt;
};

struct EntityTable {
    const char* table;
    const char* id_column;
};

EntityTable tableFor(EntityKind kind) {
    switch (kind) {
        case EntityKind::StorageTank: return {"storage_tank", "storage_tank_id"};
        case EntityKind::LoadingArm: return {"loading_arm", "loading_arm_id"};
        case EntityKind::Weighbridge: return {"weighbridge", "weighbridge_id"};
    }
    return {"storage_tank", "storage_tank_id"};
}

// Mapping column name -> SQL column. Doubles as the whitelist for updateEntityFields.
std::optional<std::string> sqlColumnFor(EntityKind kind, const std::string& column) {
    switch (kind) {
        case EntityKind::StorageTank:
            if (column == "CurrentVolume") return std::string("current_volume");
            if (column == "CurrentMass") return std::string("current_mass");
            if (column == "CurrentTemperature") return std::string("current_temperature");
            break;
        case EntityKind::LoadingArm:
            if (column == "FlowRate") return std::string("flow_rate");
            if (column == "LoadingWeight") return std::string("current_loading_weight");
            break;
        case EntityKind::Weighbridge:
            if (column == "CurrentWeight") return std::string("current_weight");
            break;
    }
    return std::nullopt;
}

const char* kDeviceColumns =
    "slave_address, slave_name, baudrate, port, data_bits, parity, stop_bits, is_active";

SlaveDevice readDevice(const Statement& st) {
    SlaveDevice device;
    device.address = st.columnInt(0);
    device.name = st.columnText(1);
    device.baudrate = st.columnInt(2);
    device.port = st.columnText(3);
    device.data_bits = st.columnInt(4);
    std::string parity = st.columnText(5);
    device.parity = parity.empty() ? 'N' : parity[0];
    device.stop_bits = st.columnInt(6);
    device.active = st.columnInt(7) != 0;
    return device;
}

const char* kMappingColumns =
    "rm.mapping_id, rm.slave_address, rm.register_address, rm.register_type, rm.function_code, "
    "rm.mapped_table, rm.mapped_entity_id, rm.mapped_column, rm.scale_factor, rm.offset_value, "
    "rm.store_historical, rm.is_read_only";

RegisterMapping readMapping(const Statement& st) {
    RegisterMapping mapping;
    mapping.mapping_id = st.columnInt(0);
    mapping.slave_address = st.columnInt(1);
    mapping.register_address = st.columnInt(2);
    // Rows are validated on the way in; an unknown spelling keeps the
    // default so the reader reports the mismatch as a configuration error.
    auto type = parseRegisterType(st.columnText(3));
    if (type) mapping.register_type = *type;
    mapping.function_code = st.columnInt(4);
    auto kind = parseEntityKind(st.columnText(5));
    if (kind) mapping.entity_kind = *kind;
    mapping.entity_id = st.columnInt(6);
    mapping.column = st.columnText(7);
    mapping.scale_factor = st.columnDouble(8);
    mapping.offset = st.columnDouble(9);
    mapping.store_historical = st.columnInt(10) != 0;
    mapping.read_only = st.columnInt(11) != 0;
    return mapping;
}

const char* kOrderColumns =
    "order_id, product_name, status, planned_quantity, weighbridge_id, driver_id, vehicle_license, "
    "initial_weight, final_weight, actual_quantity";

Order readOrder(const Statement& st) {
    Order order;
    order.order_id = st.columnInt(0);
    order.product_name = st.columnText(1);
    auto status = parseOrderStatus(st.columnText(2));
    order.status = status ? *status : OrderStatus::Cancelled;
    order.planned_quantity = st.columnDouble(3);
    order.weighbridge_id = st.columnOptionalInt(4);
    order.driver_id = st.columnOptionalInt(5);
    order.vehicle_license = st.columnText(6);
    order.initial_weight = st.columnOptionalDouble(7);
    order.final_weight = st.columnOptionalDouble(8);
    order.actual_quantity = st.columnOptionalDouble(9);
    return order;
}

RepositoryStatus reportFailure(const char* operation, const RepositoryError& e) {
    std::cerr << "Failed to " << operation << ": " << e.what() << std::endl;
    return e.code();
}

} // namespace

SqliteRepository::SqliteRepository() : db(nullptr) {}

SqliteRepository::~SqliteRepository() {
    close();
}

RepositoryStatus SqliteRepository::open(const std::string& path) {
    if (db != nullptr) {
        close();
    }
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open database " << path << ": " << sqlite3_errmsg(db) << std::endl;
        sqlite3_close(db);
        db = nullptr;
        return RepositoryStatus::PersistenceError;
    }
    try {
        createSchema();
    } catch (const RepositoryError& e) {
        sqlite3_close(db);
        db = nullptr;
        return reportFailure("create database schema", e);
    }
    std::cout << "Database " << path << " opened." << std::endl;
    return RepositoryStatus::Ok;
}

void SqliteRepository::close() {
    if (db == nullptr) return;
    sqlite3_close(db);
    db = nullptr;
}

sqlite3* SqliteRepository::connection() {
    if (db == nullptr) {
        throw RepositoryError(RepositoryStatus::PersistenceError, "No active database connection");
    }
    return db;
}

void SqliteRepository::createSchema() {
    char* error = nullptr;
    if (sqlite3_exec(connection(), kSchema, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw RepositoryError(RepositoryStatus::PersistenceError, "Error creating schema: " + message);
    }
}

bool SqliteRepository::keyExists(const char* table, const char* key_column, int key) {
    std::string sql = std::string("SELECT 1 FROM ") + table + " WHERE " + key_column + " = ?";
    Statement st(connection(), sql.c_str());
    st.bind(1, key);
    return st.step();
}

bool SqliteRepository::entityExists(EntityKind kind, int entity_id) {
    EntityTable t = tableFor(kind);
    std::string sql = std::string("SELECT 1 FROM ") + t.table + " WHERE " + t.id_column + " = ? AND is_deleted = 0";
    Statement st(connection(), sql.c_str());
    st.bind(1, entity_id);
    return st.step();
}

// --- Device registry ---

std::vector<SlaveDevice> SqliteRepository::listActiveDevices() {
    std::string sql = std::string("SELECT ") + kDeviceColumns +
                      " FROM modbus_device WHERE is_deleted = 0 ORDER BY slave_address";
    Statement st(connection(), sql.c_str());
    std::vector<SlaveDevice> devices;
    while (st.step()) {
        devices.push_back(readDevice(st));
    }
    return devices;
}

std::optional<SlaveDevice> SqliteRepository::getDevice(int slave_address) {
    std::string sql = std::string("SELECT ") + kDeviceColumns +
                      " FROM modbus_device WHERE slave_address = ? AND is_deleted = 0";
    Statement st(connection(), sql.c_str());
    st.bind(1, slave_address);
    if (st.step()) {
        return readDevice(st);
    }
    return std::nullopt;
}

RepositoryStatus SqliteRepository::addDevice(const SlaveDevice& device) {
    std::string reason;
    if (!validateDevice(device, reason)) {
        std::cerr << "Rejected slave device: " << reason << std::endl;
        return RepositoryStatus::ValidationError;
    }

    try {
        Statement existing(connection(), "SELECT is_deleted FROM modbus_device WHERE slave_address = ?");
        existing.bind(1, device.address);
        bool revive = false;
        if (existing.step()) {
            if (existing.columnInt(0) == 0) {
                std::cerr << "Slave address " << device.address << " already exists" << std::endl;
                return RepositoryStatus::ValidationError;
            }
            revive = true;
        }

        const char* sql = revive
            ? "UPDATE modbus_device SET slave_name = ?, baudrate = ?, port = ?, data_bits = ?, parity = ?, "
              "stop_bits = ?, is_active = ?, is_deleted = 0, modified_at = ? WHERE slave_address = ?"
            : "INSERT INTO modbus_device (slave_name, baudrate, port, data_bits, parity, stop_bits, is_active, "
              "modified_at, slave_address) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
        Statement st(connection(), sql);
        st.bind(1, device.name);
        st.bind(2, device.baudrate);
        st.bind(3, device.port);
        st.bind(4, device.data_bits);
        st.bind(5, std::string(1, device.parity));
        st.bind(6, device.stop_bits);
        st.bind(7, device.active ? 1 : 0);
        st.bind(8, toEpochMs(Clock::now()));
        st.bind(9, device.address);
        if (st.execute() == 0) {
            return RepositoryStatus::PersistenceError;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("add slave", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::updateDevice(const SlaveDevice& device) {
    std::string reason;
    if (!validateDevice(device, reason)) {
        std::cerr << "Rejected slave device: " << reason << std::endl;
        return RepositoryStatus::ValidationError;
    }

    try {
        Statement st(connection(),
                     "UPDATE modbus_device SET slave_name = ?, baudrate = ?, port = ?, data_bits = ?, parity = ?, "
                     "stop_bits = ?, is_active = ?, modified_at = ? WHERE slave_address = ? AND is_deleted = 0");
        st.bind(1, device.name);
        st.bind(2, device.baudrate);
        st.bind(3, device.port);
        st.bind(4, device.data_bits);
        st.bind(5, std::string(1, device.parity));
        st.bind(6, device.stop_bits);
        st.bind(7, device.active ? 1 : 0);
        st.bind(8, toEpochMs(Clock::now()));
        st.bind(9, device.address);
        if (st.execute() == 0) {
            std::cerr << "Failed to update slave with address " << device.address << std::endl;
            return RepositoryStatus::NotFound;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("update slave", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::deleteDevice(int slave_address) {
    try {
        Statement st(connection(),
                     "UPDATE modbus_device SET is_deleted = 1, modified_at = ? WHERE slave_address = ? AND is_deleted = 0");
        st.bind(1, toEpochMs(Clock::now()));
        st.bind(2, slave_address);
        if (st.execute() == 0) {
            std::cerr << "Failed to delete slave with address " << slave_address << std::endl;
            return RepositoryStatus::NotFound;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("delete slave", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::setDeviceCommunicationStatus(int slave_address, bool active) {
    try {
        Statement st(connection(),
                     "UPDATE modbus_device SET is_active = ?, modified_at = ? WHERE slave_address = ? AND is_deleted = 0");
        st.bind(1, active ? 1 : 0);
        st.bind(2, toEpochMs(Clock::now()));
        st.bind(3, slave_address);
        if (st.execute() == 0) {
            std::cerr << "Failed to update communication status for slave " << slave_address << std::endl;
            return RepositoryStatus::NotFound;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("update communication status", e);
    }
    return RepositoryStatus::Ok;
}

// --- Mapping repository ---

std::vector<RegisterMapping> SqliteRepository::listActiveMappings() {
    std::string sql = std::string("SELECT ") + kMappingColumns +
                      " FROM register_mapping rm"
                      " JOIN modbus_device m ON rm.slave_address = m.slave_address AND m.is_deleted = 0"
                      " WHERE rm.is_deleted = 0"
                      " ORDER BY rm.slave_address, rm.register_address, rm.mapping_id";
    Statement st(connection(), sql.c_str());
    std::vector<RegisterMapping> mappings;
    while (st.step()) {
        mappings.push_back(readMapping(st));
    }
    return mappings;
}

std::optional<RegisterMapping> SqliteRepository::getMapping(int mapping_id) {
    std::string sql = std::string("SELECT ") + kMappingColumns +
                      " FROM register_mapping rm WHERE rm.mapping_id = ? AND rm.is_deleted = 0";
    Statement st(connection(), sql.c_str());
    st.bind(1, mapping_id);
    if (st.step()) {
        return readMapping(st);
    }
    return std::nullopt;
}

RepositoryStatus SqliteRepository::addMapping(RegisterMapping& mapping) {
    std::string reason;
    if (!validateMapping(mapping, reason)) {
        std::cerr << "Rejected register mapping: " << reason << std::endl;
        return RepositoryStatus::ValidationError;
    }

    try {
        if (!getDevice(mapping.slave_address)) {
            std::cerr << "Rejected register mapping: unknown slave " << mapping.slave_address << std::endl;
            return RepositoryStatus::ValidationError;
        }
        if (!entityExists(mapping.entity_kind, mapping.entity_id)) {
            std::cerr << "Rejected register mapping: unknown " << toString(mapping.entity_kind) << " "
                      << mapping.entity_id << std::endl;
            return RepositoryStatus::ValidationError;
        }

        Statement st(connection(),
                     "INSERT INTO register_mapping (mapping_id, slave_address, register_address, register_type, "
                     "function_code, mapped_table, mapped_entity_id, mapped_column, scale_factor, offset_value, "
                     "store_historical, is_read_only, modified_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (mapping.mapping_id > 0) {
            st.bind(1, mapping.mapping_id);
        } else {
            st.bindNull(1);
        }
        st.bind(2, mapping.slave_address);
        st.bind(3, mapping.register_address);
        st.bind(4, toString(mapping.register_type));
        st.bind(5, mapping.function_code);
        st.bind(6, toString(mapping.entity_kind));
        st.bind(7, mapping.entity_id);
        st.bind(8, mapping.column);
        st.bind(9, mapping.scale_factor);
        st.bind(10, mapping.offset);
        st.bind(11, mapping.store_historical ? 1 : 0);
        st.bind(12, mapping.read_only ? 1 : 0);
        st.bind(13, toEpochMs(Clock::now()));
        if (st.execute() == 0) {
            return RepositoryStatus::PersistenceError;
        }
        mapping.mapping_id = static_cast<int>(sqlite3_last_insert_rowid(db));
    } catch (const RepositoryError& e) {
        return reportFailure("add register mapping", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::updateMapping(const RegisterMapping& mapping) {
    std::string reason;
    if (!validateMapping(mapping, reason)) {
        std::cerr << "Rejected register mapping: " << reason << std::endl;
        return RepositoryStatus::ValidationError;
    }

    try {
        if (!getDevice(mapping.slave_address)) {
            std::cerr << "Rejected register mapping: unknown slave " << mapping.slave_address << std::endl;
            return RepositoryStatus::ValidationError;
        }
        if (!entityExists(mapping.entity_kind, mapping.entity_id)) {
            std::cerr << "Rejected register mapping: unknown " << toString(mapping.entity_kind) << " "
                      << mapping.entity_id << std::endl;
            return RepositoryStatus::ValidationError;
        }

        Statement st(connection(),
                     "UPDATE register_mapping SET slave_address = ?, register_address = ?, register_type = ?, "
                     "function_code = ?, mapped_table = ?, mapped_entity_id = ?, mapped_column = ?, scale_factor = ?, "
                     "offset_value = ?, store_historical = ?, is_read_only = ?, modified_at = ? "
                     "WHERE mapping_id = ? AND is_deleted = 0");
        st.bind(1, mapping.slave_address);
        st.bind(2, mapping.register_address);
        st.bind(3, toString(mapping.register_type));
        st.bind(4, mapping.function_code);
        st.bind(5, toString(mapping.entity_kind));
        st.bind(6, mapping.entity_id);
        st.bind(7, mapping.column);
        st.bind(8, mapping.scale_factor);
        st.bind(9, mapping.offset);
        st.bind(10, mapping.store_historical ? 1 : 0);
        st.bind(11, mapping.read_only ? 1 : 0);
        st.bind(12, toEpochMs(Clock::now()));
        st.bind(13, mapping.mapping_id);
        if (st.execute() == 0) {
            std::cerr << "Failed to update register mapping with ID " << mapping.mapping_id << std::endl;
            return RepositoryStatus::NotFound;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("update register mapping", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::deleteMapping(int mapping_id) {
    try {
        Statement st(connection(),
                     "UPDATE register_mapping SET is_deleted = 1, modified_at = ? WHERE mapping_id = ? AND is_deleted = 0");
        st.bind(1, toEpochMs(Clock::now()));
        st.bind(2, mapping_id);
        if (st.execute() == 0) {
            std::cerr << "Failed to delete register mapping with ID " << mapping_id << std::endl;
            return RepositoryStatus::NotFound;
        }
    } catch (const RepositoryError& e) {
        return reportFailure("delete register mapping", e);
    }
    return RepositoryStatus::Ok;
}

// --- Entities ---

std::vector<StorageTank> SqliteRepository::listStorageTanks() {
    Statement st(connection(),
                 "SELECT storage_tank_id, storage_tank_name, product_name, owner_name, total_volume, unit_name, "
                 "current_volume, current_mass, current_temperature, last_reading_at "
                 "FROM storage_tank WHERE is_deleted = 0 ORDER BY storage_tank_name");
    std::vector<StorageTank> tanks;
    while (st.step()) {
        StorageTank tank;
        tank.id = st.columnInt(0);
        tank.name = st.columnText(1);
        tank.product_name = st.columnText(2);
        tank.owner_name = st.columnText(3);
        tank.total_volume = st.columnDouble(4);
        tank.unit_name = st.columnText(5);
        tank.current_volume = st.columnOptionalDouble(6);
        tank.current_mass = st.columnOptionalDouble(7);
        tank.current_temperature = st.columnOptionalDouble(8);
        tank.last_reading = st.columnOptionalTime(9);
        tanks.push_back(tank);
    }
    return tanks;
}

std::vector<LoadingArm> SqliteRepository::listLoadingArms() {
    Statement st(connection(),
                 "SELECT loading_arm_id, loading_arm_code, loading_arm_name, loading_weight, unit_name, "
                 "flow_rate, current_loading_weight, last_reading_at "
                 "FROM loading_arm WHERE is_deleted = 0 ORDER BY loading_arm_id");
    std::vector<LoadingArm> arms;
    while (st.step()) {
        LoadingArm arm;
        arm.id = st.columnInt(0);
        arm.code = st.columnText(1);
        arm.name = st.columnText(2);
        arm.loading_weight = st.columnDouble(3);
        arm.unit_name = st.columnText(4);
        arm.flow_rate = st.columnDouble(5);
        arm.current_loading_weight = st.columnDouble(6);
        arm.last_reading = st.columnOptionalTime(7);
        arms.push_back(arm);
    }
    return arms;
}

std::vector<Weighbridge> SqliteRepository::listWeighbridges() {
    Statement st(connection(),
                 "SELECT weighbridge_id, weighbridge_code, weighbridge_name, is_active "
                 "FROM weighbridge WHERE is_deleted = 0 ORDER BY weighbridge_id");
    std::vector<Weighbridge> weighbridges;
    while (st.step()) {
        Weighbridge weighbridge;
        weighbridge.id = st.columnInt(0);
        weighbridge.code = st.columnText(1);
        weighbridge.name = st.columnText(2);
        weighbridge.enabled = st.columnInt(3) != 0;
        weighbridges.push_back(weighbridge);
    }
    return weighbridges;
}

int SqliteRepository::updateEntityFields(EntityKind kind, int entity_id, const std::map<std::string, double>& fields,
                                         Timestamp read_at) {
    if (fields.empty()) {
        return 0;
    }

    EntityTable t = tableFor(kind);
    std::string sql = std::string("UPDATE ") + t.table + " SET ";
    for (const auto& field : fields) {
        auto column = sqlColumnFor(kind, field.first);
        if (!column) {
            throw RepositoryError(RepositoryStatus::ValidationError,
                                  "Column " + field.first + " cannot be written on " + toString(kind));
        }
        sql += *column + " = ?, ";
    }
    sql += std::string("last_reading_at = ? WHERE ") + t.id_column + " = ? AND is_deleted = 0";

    Statement st(connection(), sql.c_str());
    int index = 1;
    for (const auto& field : fields) {
        st.bind(index++, field.second);
    }
    st.bind(index++, toEpochMs(read_at));
    st.bind(index, entity_id);
    return st.execute();
}

// --- Orders ---

std::optional<Order> SqliteRepository::getOrder(int order_id) {
    std::string sql = std::string("SELECT ") + kOrderColumns + " FROM orders WHERE order_id = ? AND is_deleted = 0";
    Statement st(connection(), sql.c_str());
    st.bind(1, order_id);
    if (st.step()) {
        return readOrder(st);
    }
    return std::nullopt;
}

std::vector<Order> SqliteRepository::listOpenOrders() {
    std::string sql = std::string("SELECT ") + kOrderColumns +
                      " FROM orders WHERE is_deleted = 0 AND status IN ('Pending', 'Ready', 'InProgress')"
                      " ORDER BY order_id DESC";
    Statement st(connection(), sql.c_str());
    std::vector<Order> orders;
    while (st.step()) {
        orders.push_back(readOrder(st));
    }
    return orders;
}

int SqliteRepository::claimOrderForWeighing(int order_id, int weighbridge_id, int driver_id,
                                            const std::string& vehicle_license) {
    Statement st(connection(),
                 "UPDATE orders SET weighbridge_id = ?, driver_id = ?, vehicle_license = ?, status = 'InProgress', "
                 "loading_started_at = ? "
                 "WHERE order_id = ? AND is_deleted = 0 AND status IN ('Pending', 'Ready', 'InProgress')");
    st.bind(1, weighbridge_id);
    st.bind(2, driver_id);
    st.bind(3, vehicle_license);
    st.bind(4, toEpochMs(Clock::now()));
    st.bind(5, order_id);
    return st.execute();
}

int SqliteRepository::completeWeighing(const WeighingSession& session) {
    Statement st(connection(),
                 "UPDATE orders SET weighbridge_id = ?, driver_id = ?, initial_weight = ?, final_weight = ?, "
                 "actual_quantity = ?, status = 'Completed', loading_completed_at = ? "
                 "WHERE order_id = ? AND is_deleted = 0 AND status = 'InProgress'");
    st.bind(1, session.weighbridge_id);
    st.bind(2, session.driver_id);
    st.bind(3, session.tare_weight);
    st.bind(4, session.gross_weight);
    st.bind(5, session.net_weight);
    st.bind(6, toEpochMs(Clock::now()));
    st.bind(7, session.order_id);
    return st.execute();
}

// --- History ---

void SqliteRepository::recordHistoricalValue(int mapping_id, double value, Timestamp at) {
    Statement st(connection(), "INSERT INTO register_history (mapping_id, value, recorded_at) VALUES (?, ?, ?)");
    st.bind(1, mapping_id);
    st.bind(2, value);
    st.bind(3, toEpochMs(at));
    st.execute();
}

std::vector<HistoricalValue> SqliteRepository::listHistory(int mapping_id) {
    Statement st(connection(),
                 "SELECT mapping_id, value, recorded_at FROM register_history WHERE mapping_id = ? "
                 "ORDER BY recorded_at, history_id");
    st.bind(1, mapping_id);
    std::vector<HistoricalValue> history;
    while (st.step()) {
        HistoricalValue entry;
        entry.mapping_id = st.columnInt(0);
        entry.value = st.columnDouble(1);
        entry.recorded_at = fromEpochMs(st.columnInt64(2));
        history.push_back(entry);
    }
    return history;
}

// --- Seeding ---

RepositoryStatus SqliteRepository::addStorageTank(StorageTank& tank) {
    if (tank.name.empty()) {
        std::cerr << "Rejected storage tank: name is empty" << std::endl;
        return RepositoryStatus::ValidationError;
    }
    try {
        Statement st(connection(),
                     "INSERT INTO storage_tank (storage_tank_id, storage_tank_name, product_name, owner_name, "
                     "total_volume, unit_name) VALUES (?, ?, ?, ?, ?, ?)");
        if (tank.id > 0) st.bind(1, tank.id); else st.bindNull(1);
        st.bind(2, tank.name);
        st.bind(3, tank.product_name);
        st.bind(4, tank.owner_name);
        st.bind(5, tank.total_volume);
        st.bind(6, tank.unit_name);
        st.execute();
        tank.id = static_cast<int>(sqlite3_last_insert_rowid(db));
    } catch (const RepositoryError& e) {
        return reportFailure("add storage tank", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::addLoadingArm(LoadingArm& arm) {
    if (arm.code.empty() || arm.name.empty()) {
        std::cerr << "Rejected loading arm: code and name are required" << std::endl;
        return RepositoryStatus::ValidationError;
    }
    try {
        Statement st(connection(),
                     "INSERT INTO loading_arm (loading_arm_id, loading_arm_code, loading_arm_name, loading_weight, "
                     "unit_name) VALUES (?, ?, ?, ?, ?)");
        if (arm.id > 0) st.bind(1, arm.id); else st.bindNull(1);
        st.bind(2, arm.code);
        st.bind(3, arm.name);
        st.bind(4, arm.loading_weight);
        st.bind(5, arm.unit_name);
        st.execute();
        arm.id = static_cast<int>(sqlite3_last_insert_rowid(db));
    } catch (const RepositoryError& e) {
        return reportFailure("add loading arm", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::addWeighbridge(Weighbridge& weighbridge) {
    if (weighbridge.code.empty() || weighbridge.name.empty()) {
        std::cerr << "Rejected weighbridge: code and name are required" << std::endl;
        return RepositoryStatus::ValidationError;
    }
    try {
        Statement st(connection(),
                     "INSERT INTO weighbridge (weighbridge_id, weighbridge_code, weighbridge_name, is_active) "
                     "VALUES (?, ?, ?, ?)");
        if (weighbridge.id > 0) st.bind(1, weighbridge.id); else st.bindNull(1);
        st.bind(2, weighbridge.code);
        st.bind(3, weighbridge.name);
        st.bind(4, weighbridge.enabled ? 1 : 0);
        st.execute();
        weighbridge.id = static_cast<int>(sqlite3_last_insert_rowid(db));
    } catch (const RepositoryError& e) {
        return reportFailure("add weighbridge", e);
    }
    return RepositoryStatus::Ok;
}

RepositoryStatus SqliteRepository::addOrder(Order& order) {
    try {
        Statement st(connection(),
                     "INSERT INTO orders (order_id, product_name, status, planned_quantity, vehicle_license) "
                     "VALUES (?, ?, ?, ?, ?)");
        if (order.order_id > 0) st.bind(1, order.order_id); else st.bindNull(1);
        st.bind(2, order.product_name);
        st.bind(3, toString(order.status));
        st.bind(4, order.planned_quantity);
        st.bind(5, order.vehicle_license);
        st.execute();
        order.order_id = static_cast<int>(sqlite3_last_insert_rowid(db));
    } catch (const RepositoryError& e) {
        return reportFailure("add order", e);
    }
    return RepositoryStatus::Ok;
}

size_t SqliteRepository::importSite(const SiteProfile& site) {
    size_t added = 0;

    // Keys are checked including deleted rows, so a record removed by an
    // operator is not brought back on the next start
    for (const auto& device : site.devices) {
        if (keyExists("modbus_device", "slave_address", device.address)) continue;
        if (addDevice(device) == RepositoryStatus::Ok) ++added;
    }
    for (auto tank : site.storage_tanks) {
        if (tank.id > 0 && keyExists("storage_tank", "storage_tank_id", tank.id)) continue;
        if (addStorageTank(tank) == RepositoryStatus::Ok) ++added;
    }
    for (auto arm : site.loading_arms) {
        if (arm.id > 0 && keyExists("loading_arm", "loading_arm_id", arm.id)) continue;
        if (addLoadingArm(arm) == RepositoryStatus::Ok) ++added;
    }
    for (auto weighbridge : site.weighbridges) {
        if (weighbridge.id > 0 && keyExists("weighbridge", "weighbridge_id", weighbridge.id)) continue;
        if (addWeighbridge(weighbridge) == RepositoryStatus::Ok) ++added;
    }
    for (auto order : site.orders) {
        if (order.order_id > 0 && keyExists("orders", "order_id", order.order_id)) continue;
        if (addOrder(order) == RepositoryStatus::Ok) ++added;
    }
    for (auto mapping : site.mappings) {
        if (mapping.mapping_id > 0 && keyExists("register_mapping", "mapping_id", mapping.mapping_id)) continue;
        if (addMapping(mapping) == RepositoryStatus::Ok) ++added;
    }

    if (added > 0) {
        std::cout << "Imported " << added << " site record(s) into the database." << std::endl;
    }
    return added;
}
