#include "register_reader.hpp"
#include <iostream>

RegisterReader::RegisterReader(TransportChannel& ch) : channel(ch) {}

double RegisterReader::scale(uint16_t raw, const RegisterMapping& mapping) {
    return static_cast<double>(raw) * mapping.scale_factor + mapping.offset;
}

ReadError RegisterReader::readRaw(int slave_address, int function_code, int register_address, uint16_t& raw) {
    if (function_code < 1 || function_code > 4) {
        std::cerr << "Unsupported function code " << function_code << " for register " << register_address
                  << " of slave " << slave_address << std::endl;
        return ReadError::ConfigurationError;
    }

    std::vector<uint16_t> values;
    ReadError error = channel.readRegisters(slave_address, function_code, register_address, 1, values);
    if (error != ReadError::None) {
        return error;
    }
    if (values.size() != 1) {
        return ReadError::DeviceError;
    }
    raw = values.front();
    return ReadError::None;
}

ReadResult RegisterReader::read(int slave_address, const RegisterMapping& mapping) {
    RegisterPoint point;
    point.register_address = mapping.register_address;
    point.function_code = mapping.function_code;
    point.mappings.push_back(mapping);
    return readPoint(slave_address, point).front();
}

std::vector<ReadResult> RegisterReader::readPoint(int slave_address, const RegisterPoint& point) {
    std::vector<ReadResult> results;
    results.reserve(point.mappings.size());

    // A mapping whose register type disagrees with the function code is a
    // configuration fault of that mapping alone.
    bool any_consistent = false;
    for (const auto& mapping : point.mappings) {
        if (mapping.function_code == functionCodeFor(mapping.register_type)) {
            any_consistent = true;
            break;
        }
    }

    uint16_t raw = 0;
    ReadError bus_error = ReadError::ConfigurationError;
    if (any_consistent) {
        bus_error = readRaw(slave_address, point.function_code, point.register_address, raw);
    }
    Timestamp now = Clock::now();

    for (const auto& mapping : point.mappings) {
        ReadResult result;
        result.slave_address = slave_address;
        result.mapping_id = mapping.mapping_id;
        result.timestamp = now;

        if (mapping.function_code != functionCodeFor(mapping.register_type)) {
            result.error = ReadError::ConfigurationError;
        } else {
            result.error = bus_error;
        }

        if (result.error == ReadError::None) {
            result.raw = raw;
            result.scaled = scale(raw, mapping);
        }
        results.push_back(result);
    }
    return results;
}
