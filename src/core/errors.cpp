/**
 * @file errors.cpp
 * @brief Engine error taxonomy
 * 
 * @date 2025
 */

#include "runcage/core/errors.hpp"

namespace runcage {
namespace core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguage";
        case ErrorCode::WORKSPACE:            return "WorkspaceError";
        case ErrorCode::IMAGE_UNAVAILABLE:    return "ImageUnavailable";
        case ErrorCode::CONTAINER_CREATE:     return "ContainerCreationFailed";
        case ErrorCode::CONTAINER_START:      return "ContainerStartFailed";
        case ErrorCode::TIMEOUT:              return "Timeout";
        case ErrorCode::BACKEND:              return "BackendError";
        case ErrorCode::CONFIGURATION:        return "ConfigurationError";
    }
    return "Unknown";
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message)
    , code_(code) {
}

} // namespace core
} // namespace runcage
