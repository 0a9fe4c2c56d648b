#include "config_loader.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

// Helpers to convert strings to enums
RegisterType to_register_type(const std::string& s) {
    auto type = parseRegisterType(s);
    if (!type) throw std::runtime_error("Invalid register type: " + s);
    return *type;
}

EntityKind to_entity_kind(const std::string& s) {
    auto kind = parseEntityKind(s);
    if (!kind) throw std::runtime_error("Invalid mapped entity: " + s);
    return *kind;
}

OrderStatus to_order_status(const std::string& s) {
    auto status = parseOrderStatus(s);
    if (!status) throw std::runtime_error("Invalid order status: " + s);
    return *status;
}

char to_parity(const std::string& s) {
    if (s.size() != 1) throw std::runtime_error("Invalid parity: " + s);
    return s[0];
}

template <typename T>
T value_or(const YAML::Node& node, const char* key, const T& fallback) {
    return node[key] ? node[key].as<T>() : fallback;
}

void load_serial(const YAML::Node& node, ConnectionParams& serial) {
    if (!node) return;
    serial.port = value_or<std::string>(node, "port", serial.port);
    serial.baudrate = value_or<int>(node, "baudrate", serial.baudrate);
    if (node["parity"]) serial.parity = to_parity(node["parity"].as<std::string>());
    serial.stopbits = value_or<int>(node, "stopbits", serial.stopbits);
    serial.bytesize = value_or<int>(node, "bytesize", serial.bytesize);
    serial.timeout = value_or<double>(node, "timeout", serial.timeout);

    std::string reason;
    if (!validateConnectionParams(serial, reason)) {
        throw std::runtime_error("Invalid serial settings: " + reason);
    }
}

void load_polling(const YAML::Node& node, PollingSettings& polling) {
    if (!node) return;
    polling.cycle_interval_ms = value_or<int>(node, "cycle_interval_ms", polling.cycle_interval_ms);
    polling.persist_interval_ms = value_or<int>(node, "persist_interval_ms", polling.persist_interval_ms);
    polling.verbose = value_or<bool>(node, "verbose", polling.verbose);

    if (polling.cycle_interval_ms <= 0) {
        throw std::runtime_error("polling.cycle_interval_ms must be positive");
    }
    if (polling.persist_interval_ms <= 0) {
        throw std::runtime_error("polling.persist_interval_ms must be positive");
    }
}

void load_site(const YAML::Node& site_node, SiteProfile& site) {
    if (!site_node) return;

    // Devices
    for (const auto& node : site_node["devices"]) {
        SlaveDevice device;
        device.address = node["address"].as<int>();
        device.name = node["name"].as<std::string>();
        device.baudrate = value_or<int>(node, "baudrate", device.baudrate);
        device.port = value_or<std::string>(node, "port", device.port);
        device.data_bits = value_or<int>(node, "data_bits", device.data_bits);
        if (node["parity"]) device.parity = to_parity(node["parity"].as<std::string>());
        device.stop_bits = value_or<int>(node, "stop_bits", device.stop_bits);
        device.active = value_or<bool>(node, "active", device.active);

        std::string reason;
        if (!validateDevice(device, reason)) {
            throw std::runtime_error("Invalid device " + std::to_string(device.address) + ": " + reason);
        }
        site.devices.push_back(device);
    }

    // Entities
    for (const auto& node : site_node["storage_tanks"]) {
        StorageTank tank;
        tank.id = node["id"].as<int>();
        tank.name = node["name"].as<std::string>();
        tank.product_name = value_or<std::string>(node, "product", "");
        tank.owner_name = value_or<std::string>(node, "owner", "");
        tank.total_volume = value_or<double>(node, "total_volume", 0.0);
        tank.unit_name = value_or<std::string>(node, "unit", "");
        site.storage_tanks.push_back(tank);
    }
    for (const auto& node : site_node["loading_arms"]) {
        LoadingArm arm;
        arm.id = node["id"].as<int>();
        arm.code = node["code"].as<std::string>();
        arm.name = node["name"].as<std::string>();
        arm.unit_name = value_or<std::string>(node, "unit", "");
        site.loading_arms.push_back(arm);
    }
    for (const auto& node : site_node["weighbridges"]) {
        Weighbridge weighbridge;
        weighbridge.id = node["id"].as<int>();
        weighbridge.code = node["code"].as<std::string>();
        weighbridge.name = node["name"].as<std::string>();
        weighbridge.enabled = value_or<bool>(node, "enabled", true);
        site.weighbridges.push_back(weighbridge);
    }

    // Orders
    for (const auto& node : site_node["orders"]) {
        Order order;
        order.order_id = node["id"].as<int>();
        order.product_name = value_or<std::string>(node, "product", "");
        order.status = to_order_status(value_or<std::string>(node, "status", "Pending"));
        order.planned_quantity = value_or<double>(node, "planned_quantity", 0.0);
        order.vehicle_license = value_or<std::string>(node, "vehicle_license", "");
        site.orders.push_back(order);
    }

    // Register mappings
    for (const auto& node : site_node["register_mappings"]) {
        RegisterMapping mapping;
        mapping.mapping_id = value_or<int>(node, "id", 0);
        mapping.slave_address = node["slave"].as<int>();
        mapping.register_address = node["register"].as<int>();
        mapping.register_type = to_register_type(node["type"].as<std::string>());
        mapping.function_code = value_or<int>(node, "function_code", functionCodeFor(mapping.register_type));
        mapping.entity_kind = to_entity_kind(node["entity"].as<std::string>());
        mapping.entity_id = node["entity_id"].as<int>();
        mapping.column = node["column"].as<std::string>();
        mapping.scale_factor = value_or<double>(node, "scale", 1.0);
        mapping.offset = value_or<double>(node, "offset", 0.0);
        mapping.store_historical = value_or<bool>(node, "store_historical", false);
        mapping.read_only = value_or<bool>(node, "read_only", true);

        std::string reason;
        if (!validateMapping(mapping, reason)) {
            throw std::runtime_error("Invalid register mapping " + std::to_string(mapping.mapping_id) + ": " + reason);
        }
        site.mappings.push_back(mapping);
    }
}

Config load_root(const YAML::Node& root) {
    Config config;
    load_serial(root["serial"], config.serial);
    if (root["database"]) {
        config.database_path = value_or<std::string>(root["database"], "path", config.database_path);
    }
    load_polling(root["polling"], config.polling);
    load_site(root["site"], config.site);
    return config;
}

} // namespace

Config ConfigLoader::loadConfig(const std::string& filename) {
    try {
        return load_root(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filename + ": " + e.what());
    }
}

Config ConfigLoader::parseConfig(const std::string& text) {
    try {
        return load_root(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse configuration: ") + e.what());
    }
}
