/**
 * @file container_backend.cpp
 * @brief Backend error kind names
 * 
 * @date 2025
 */

#include "runcage/backends/container_backend.hpp"

namespace runcage {
namespace backends {

const char* BackendErrorKindName(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::NONE: return "None";
        case BackendErrorKind::IMAGE_UNAVAILABLE: return "ImageUnavailable";
        case BackendErrorKind::CREATE_FAILED: return "CreateFailed";
        case BackendErrorKind::START_FAILED: return "StartFailed";
        case BackendErrorKind::WAIT_FAILED: return "WaitFailed";
        case BackendErrorKind::TIMEOUT: return "Timeout";
        case BackendErrorKind::DAEMON_UNREACHABLE: return "DaemonUnreachable";
        case BackendErrorKind::NOT_FOUND: return "NotFound";
        case BackendErrorKind::PROTOCOL: return "Protocol";
    }
    return "Unknown";
}

} // namespace backends
} // namespace runcage
