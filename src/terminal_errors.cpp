#include "terminal_errors.hpp"

const char* toString(ConnectionError error) {
    switch (error) {
        case ConnectionError::None: return "ok";
        case ConnectionError::InvalidParameters: return "invalid connection parameters";
        case ConnectionError::AlreadyOpen: return "channel already open";
        case ConnectionError::OpenFailed: return "failed to open serial port";
    }
    return "unknown connection error";
}

const char* toString(ReadError error) {
    switch (error) {
        case ReadError::None: return "ok";
        case ReadError::NotConnected: return "not connected";
        case ReadError::DeviceError: return "device error";
        case ReadError::ConfigurationError: return "configuration error";
    }
    return "unknown read error";
}

const char* toString(RepositoryStatus status) {
    switch (status) {
        case RepositoryStatus::Ok: return "ok";
        case RepositoryStatus::ValidationError: return "validation error";
        case RepositoryStatus::NotFound: return "not found";
        case RepositoryStatus::PersistenceError: return "persistence error";
    }
    return "unknown repository status";
}

const char* toString(WeighingError error) {
    switch (error) {
        case WeighingError::None: return "ok";
        case WeighingError::OrderNotAvailable: return "order not found or not available for weighing";
        case WeighingError::SessionAlreadyActive: return "weighbridge already has an active weighing";
        case WeighingError::NoActiveSession: return "no active weighing";
        case WeighingError::NoCurrentReading: return "no current weight reading available";
        case WeighingError::TareNotSet: return "tare weight has not been set";
        case WeighingError::PersistenceError: return "failed to store weighing";
    }
    return "unknown weighing error";
}
