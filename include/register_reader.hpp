#ifndef REGISTER_READER_H
#define REGISTER_READER_H

#include "register_map.hpp"
#include "terminal_errors.hpp"
#include "transport_channel.hpp"
#include <vector>

/**
 * @struct ReadResult
 * @brief Outcome of reading one mapping. error == ReadError::None means raw and
 * scaled are valid.
 */
struct ReadResult {
    int slave_address = 0;
    int mapping_id = 0;
    ReadError error = ReadError::None;
    uint16_t raw = 0;
    double scaled = 0.0;
    Timestamp timestamp;

    bool ok() const { return error == ReadError::None; }
};

/**
 * @class RegisterReader
 * @brief Turns mappings into bus reads and raw values into scaled values.
 *
 * Never throws. Failures are per mapping and returned in the result.
 */
class RegisterReader {
public:
    explicit RegisterReader(TransportChannel& channel);

    /**
     * @brief Reads the register behind one mapping.
     * @param slave_address The slave to address.
     * @param mapping The mapping to read and scale.
     * @return The scaled value, or a DeviceError / ConfigurationError failure.
     */
    ReadResult read(int slave_address, const RegisterMapping& mapping);

    /**
     * @brief Reads a shared register once and scales it for every mapping on it.
     * @return One result per mapping of the point, in the point's order.
     */
    std::vector<ReadResult> readPoint(int slave_address, const RegisterPoint& point);

    /// @brief raw * scale_factor + offset
    static double scale(uint16_t raw, const RegisterMapping& mapping);

private:
    ReadError readRaw(int slave_address, int function_code, int register_address, uint16_t& raw);

    TransportChannel& channel;
};

#endif // REGISTER_READER_H
