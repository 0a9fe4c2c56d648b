#ifndef TRANSPORT_CHANNEL_H
#define TRANSPORT_CHANNEL_H

#include "terminal_errors.hpp"
#include "terminal_model.hpp"
#include <cstdint>
#include <mutex>
#include <vector>

typedef struct _modbus modbus_t;

/**
 * @class TransportChannel
 * @brief The single connection to the RTU bus.
 *
 * RTU is a half-duplex shared medium, so implementations must never let two
 * requests overlap on the wire.
 */
class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    /**
     * @brief Opens the serial line.
     * @param params Port and line settings.
     * @return ConnectionError::None on success.
     */
    virtual ConnectionError open(const ConnectionParams& params) = 0;

    /**
     * @brief Closes the serial line. Safe to call when already closed.
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Reads count consecutive items from one slave.
     * @param slave_address Target slave, 1..247.
     * @param function_code 1 coils, 2 discrete inputs, 3 holding registers, 4 input registers.
     * @param register_address First item address (0-based protocol address).
     * @param count Number of items.
     * @param values Filled with the values read; bits are widened to 0/1.
     * @return ReadError::None on success.
     */
    virtual ReadError readRegisters(int slave_address, int function_code, int register_address,
                                    int count, std::vector<uint16_t>& values) = 0;
};

/**
 * @class RtuTransportChannel
 * @brief TransportChannel over a libmodbus RTU context.
 */
class RtuTransportChannel : public TransportChannel {
public:
    RtuTransportChannel();

    /**
     * @brief Destructor, closes the port if still open.
     */
    ~RtuTransportChannel() override;

    RtuTransportChannel(const RtuTransportChannel&) = delete;
    RtuTransportChannel& operator=(const RtuTransportChannel&) = delete;

    ConnectionError open(const ConnectionParams& params) override;
    void close() override;
    bool isOpen() const override;
    ReadError readRegisters(int slave_address, int function_code, int register_address,
                            int count, std::vector<uint16_t>& values) override;

private:
    mutable std::mutex bus_mutex;
    modbus_t *ctx;
    std::string port;
};

#endif // TRANSPORT_CHANNEL_H
