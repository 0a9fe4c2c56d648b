#include "terminal_model.hpp"
#include <algorithm>
#include <cmath>

std::string toString(RegisterType type) {
    switch (type) {
        case RegisterType::Coil: return "coil";
        case RegisterType::DiscreteInput: return "discrete-input";
        case RegisterType::HoldingRegister: return "holding-register";
        case RegisterType::InputRegister: return "input-register";
    }
    return "unknown";
}

std::string toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::StorageTank: return "StorageTank";
        case EntityKind::LoadingArm: return "LoadingArm";
        case EntityKind::Weighbridge: return "Weighbridge";
    }
    return "unknown";
}

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending: return "Pending";
        case OrderStatus::Ready: return "Ready";
        case OrderStatus::InProgress: return "InProgress";
        case OrderStatus::Completed: return "Completed";
        case OrderStatus::Cancelled: return "Cancelled";
    }
    return "unknown";
}

std::optional<RegisterType> parseRegisterType(const std::string& s) {
    if (s == "coil") return RegisterType::Coil;
    if (s == "discrete-input") return RegisterType::DiscreteInput;
    if (s == "holding-register") return RegisterType::HoldingRegister;
    if (s == "input-register") return RegisterType::InputRegister;
    return std::nullopt;
}

std::optional<EntityKind> parseEntityKind(const std::string& s) {
    if (s == "StorageTank") return EntityKind::StorageTank;
    if (s == "LoadingArm") return EntityKind::LoadingArm;
    if (s == "Weighbridge") return EntityKind::Weighbridge;
    return std::nullopt;
}

std::optional<OrderStatus> parseOrderStatus(const std::string& s) {
    if (s == "Pending") return OrderStatus::Pending;
    if (s == "Ready") return OrderStatus::Ready;
    if (s == "InProgress") return OrderStatus::InProgress;
    if (s == "Completed") return OrderStatus::Completed;
    if (s == "Cancelled") return OrderStatus::Cancelled;
    return std::nullopt;
}

int functionCodeFor(RegisterType type) {
    switch (type) {
        case RegisterType::Coil: return 1;
        case RegisterType::DiscreteInput: return 2;
        case RegisterType::HoldingRegister: return 3;
        case RegisterType::InputRegister: return 4;
    }
    return 0;
}

const std::vector<std::string>& mappableColumns(EntityKind kind) {
    static const std::vector<std::string> tank_columns = {"CurrentVolume", "CurrentMass", "CurrentTemperature"};
    static const std::vector<std::string> arm_columns = {"FlowRate", "LoadingWeight"};
    static const std::vector<std::string> weighbridge_columns = {"CurrentWeight"};
    switch (kind) {
        case EntityKind::StorageTank: return tank_columns;
        case EntityKind::LoadingArm: return arm_columns;
        case EntityKind::Weighbridge: return weighbridge_columns;
    }
    return tank_columns;
}

const std::string& livenessColumn(EntityKind kind) {
    // First entry of each column list is the one that marks the entity live
    return mappableColumns(kind).front();
}

bool isMappableColumn(EntityKind kind, const std::string& column) {
    const auto& columns = mappableColumns(kind);
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

bool validateConnectionParams(const ConnectionParams& params, std::string& reason) {
    static const int baudrates[] = {9600, 19200, 38400, 57600, 115200};
    if (params.port.empty()) {
        reason = "serial port is empty";
        return false;
    }
    if (std::find(std::begin(baudrates), std::end(baudrates), params.baudrate) == std::end(baudrates)) {
        reason = "unsupported baudrate " + std::to_string(params.baudrate);
        return false;
    }
    if (params.parity != 'N' && params.parity != 'E' && params.parity != 'O') {
        reason = std::string("unsupported parity '") + params.parity + "'";
        return false;
    }
    if (params.stopbits != 1 && params.stopbits != 2) {
        reason = "stop bits must be 1 or 2";
        return false;
    }
    if (params.bytesize != 7 && params.bytesize != 8) {
        reason = "byte size must be 7 or 8";
        return false;
    }
    if (!(params.timeout > 0.0)) {
        reason = "timeout must be positive";
        return false;
    }
    return true;
}

bool validateDevice(const SlaveDevice& device, std::string& reason) {
    if (device.address < 1 || device.address > 247) {
        reason = "slave address " + std::to_string(device.address) + " outside 1..247";
        return false;
    }
    if (device.name.empty()) {
        reason = "slave name is empty";
        return false;
    }
    ConnectionParams line;
    line.port = device.port.empty() ? std::string("-") : device.port;
    line.baudrate = device.baudrate;
    line.parity = device.parity;
    line.stopbits = device.stop_bits;
    line.bytesize = device.data_bits;
    return validateConnectionParams(line, reason);
}

bool validateMapping(const RegisterMapping& mapping, std::string& reason) {
    if (mapping.slave_address < 1 || mapping.slave_address > 247) {
        reason = "slave address " + std::to_string(mapping.slave_address) + " outside 1..247";
        return false;
    }
    if (mapping.register_address < 0 || mapping.register_address > 0xFFFF) {
        reason = "register address " + std::to_string(mapping.register_address) + " outside 0..65535";
        return false;
    }
    if (mapping.function_code != functionCodeFor(mapping.register_type)) {
        reason = "function code " + std::to_string(mapping.function_code) +
                 " does not read " + toString(mapping.register_type);
        return false;
    }
    if (!isMappableColumn(mapping.entity_kind, mapping.column)) {
        reason = "column '" + mapping.column + "' cannot be mapped on " + toString(mapping.entity_kind);
        return false;
    }
    if (!std::isfinite(mapping.scale_factor) || !std::isfinite(mapping.offset)) {
        reason = "scale factor and offset must be finite";
        return false;
    }
    return true;
}
