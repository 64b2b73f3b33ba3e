#pragma once

/**
 * EngineException.hpp
 *
 * Error codes and the exception type delivered through engine handles.
 */

#include <stdexcept>
#include <string>

namespace downlink::core {

/**
 * Engine error codes
 */
enum class ErrorCode {
    EngineClosed,
    DuplicateRequest,
    InvalidConcurrentLimit,
    StorageUnavailable,
    NotFound,
    InvalidRequest,
    GlobalConfigurationNotSet
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::EngineClosed:              return "engine_closed";
        case ErrorCode::DuplicateRequest:          return "duplicate_request";
        case ErrorCode::InvalidConcurrentLimit:    return "invalid_concurrent_limit";
        case ErrorCode::StorageUnavailable:        return "storage_unavailable";
        case ErrorCode::NotFound:                  return "not_found";
        case ErrorCode::InvalidRequest:            return "invalid_request";
        case ErrorCode::GlobalConfigurationNotSet: return "global_configuration_not_set";
    }
    return "unknown";
}

/**
 * Exception carried by a failed engine handle
 */
class EngineException : public std::runtime_error {
public:
    EngineException(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message)
        , m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace downlink::core
