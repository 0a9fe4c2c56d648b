#ifndef TERMINAL_ERRORS_H
#define TERMINAL_ERRORS_H

#include <stdexcept>
#include <string>

/// @brief Outcome of opening the RTU channel.
enum class ConnectionError {
    None,
    InvalidParameters, ///< Rejected before touching the port
    AlreadyOpen,       ///< Only one handle may be open at a time
    OpenFailed         ///< Context creation or modbus_connect failed
};

/// @brief Outcome of a single register read.
enum class ReadError {
    None,
    NotConnected,       ///< No open channel
    DeviceError,        ///< Bus exception, timeout or malformed response
    ConfigurationError  ///< Unsupported function code or inconsistent mapping
};

/// @brief Outcome of a repository mutation.
enum class RepositoryStatus {
    Ok,
    ValidationError,
    NotFound,
    PersistenceError
};

/// @brief Failures of the weighing workflow, returned to the caller.
enum class WeighingError {
    None,
    OrderNotAvailable,
    SessionAlreadyActive,
    NoActiveSession,
    NoCurrentReading,
    TareNotSet,
    PersistenceError
};

const char* toString(ConnectionError error);
const char* toString(ReadError error);
const char* toString(RepositoryStatus status);
const char* toString(WeighingError error);

/**
 * @class RepositoryError
 * @brief Thrown by repository queries when the database cannot answer.
 */
class RepositoryError : public std::runtime_error {
public:
    RepositoryError(RepositoryStatus status, const std::string& message)
        : std::runtime_error(message), status(status) {}

    RepositoryStatus code() const { return status; }

private:
    RepositoryStatus status;
};

#endif // TERMINAL_ERRORS_H
