/**
 * @file backend_factory.hpp
 * @brief One-time container backend selection
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"
#include "runcage/backends/docker_api_backend.hpp"
#include "runcage/backends/docker_cli_backend.hpp"

#include <memory>
#include <string>

namespace runcage {
namespace backends {

/**
 * @enum BackendMode
 * @brief Which backend the engine should use
 */
enum class BackendMode {
    AUTO,  ///< API if the socket answers, else CLI
    API,   ///< Docker Engine API only
    CLI    ///< docker CLI only
};

const char* BackendModeName(BackendMode mode);

/**
 * @brief Parse "auto", "api" or "cli" (case-insensitive)
 * @throws core::ConfigError for any other value
 */
BackendMode ParseBackendMode(const std::string& value);

/**
 * @brief Build and probe a backend
 * 
 * AUTO pings the API backend first and falls back to the CLI backend.
 * A forced mode must answer its ping.
 * 
 * @return Backend that answered Ping()
 * 
 * @throws core::EngineError (BACKEND) when no runtime answers
 */
std::unique_ptr<ContainerBackend> CreateBackend(BackendMode mode,
                                                const DockerApiOptions& api_options,
                                                const DockerCliOptions& cli_options);

} // namespace backends
} // namespace runcage
