#include "transport_channel.hpp"
#include <modbus/modbus.h>
#include <cerrno>
#include <cmath>
#include <iostream>

RtuTransportChannel::RtuTransportChannel() : ctx(nullptr) {}

RtuTransportChannel::~RtuTransportChannel() {
    close();
}

ConnectionError RtuTransportChannel::open(const ConnectionParams& params) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    if (ctx != nullptr) {
        std::cerr << "Modbus channel already open on " << port << std::endl;
        return ConnectionError::AlreadyOpen;
    }

    std::string reason;
    if (!validateConnectionParams(params, reason)) {
        std::cerr << "Invalid Modbus connection parameters: " << reason << std::endl;
        return ConnectionError::InvalidParameters;
    }

    ctx = modbus_new_rtu(params.port.c_str(), params.baudrate, params.parity,
                         params.bytesize, params.stopbits);
    if (ctx == nullptr) {
        std::cerr << "Failed to create modbus context: " << modbus_strerror(errno) << std::endl;
        return ConnectionError::OpenFailed;
    }

    double whole_seconds = std::floor(params.timeout);
    auto sec = static_cast<uint32_t>(whole_seconds);
    auto usec = static_cast<uint32_t>((params.timeout - whole_seconds) * 1000000.0);
    modbus_set_response_timeout(ctx, sec, usec);

    if (modbus_connect(ctx) == -1) {
        std::cerr << "Failed to connect to the Modbus serial port " << params.port << ": "
                  << modbus_strerror(errno) << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        return ConnectionError::OpenFailed;
    }

    port = params.port;
    std::cout << "Connected to Modbus on port " << port << " (" << params.baudrate << " "
              << params.bytesize << params.parity << params.stopbits << ")" << std::endl;
    return ConnectionError::None;
}

void RtuTransportChannel::close() {
    std::lock_guard<std::mutex> lock(bus_mutex);
    if (ctx == nullptr) return;

    modbus_close(ctx);
    modbus_free(ctx);
    ctx = nullptr;
    std::cout << "Disconnected from Modbus serial port " << port << std::endl;
}

bool RtuTransportChannel::isOpen() const {
    std::lock_guard<std::mutex> lock(bus_mutex);
    return ctx != nullptr;
}

ReadError RtuTransportChannel::readRegisters(int slave_address, int function_code, int register_address,
                                             int count, std::vector<uint16_t>& values) {
    std::lock_guard<std::mutex> lock(bus_mutex);
    if (ctx == nullptr) {
        return ReadError::NotConnected;
    }
    if (count <= 0) {
        return ReadError::ConfigurationError;
    }

    if (modbus_set_slave(ctx, slave_address) == -1) {
        std::cerr << "Invalid slave address " << slave_address << ": " << modbus_strerror(errno) << std::endl;
        return ReadError::ConfigurationError;
    }

    int rc = -1;
    values.assign(count, 0);
    switch (function_code) {
        case 1:
        case 2: {
            std::vector<uint8_t> bits(count, 0);
            rc = (function_code == 1)
                ? modbus_read_bits(ctx, register_address, count, bits.data())
                : modbus_read_input_bits(ctx, register_address, count, bits.data());
            for (int i = 0; i < count; ++i) {
                values[i] = bits[i] ? 1 : 0;
            }
            break;
        }
        case 3:
            rc = modbus_read_registers(ctx, register_address, count, values.data());
            break;
        case 4:
            rc = modbus_read_input_registers(ctx, register_address, count, values.data());
            break;
        default:
            return ReadError::ConfigurationError;
    }

    if (rc != count) {
        std::cerr << "Error reading register " << register_address << " (fc " << function_code
                  << ") from slave " << slave_address << ": " << modbus_strerror(errno) << std::endl;
        // Discard whatever is left of a broken frame before the next request
        modbus_flush(ctx);
        values.clear();
        return ReadError::DeviceError;
    }
    return ReadError::None;
}
