/**
 * @file engine_config.hpp
 * @brief Engine-wide configuration, builder and JSON loader
 * 
 * **Configuration file** (every key optional, unknown keys ignored):
 * ```json
 * {
 *   "backend": "auto",
 *   "docker_socket": "/var/run/docker.sock",
 *   "docker_binary": "docker",
 *   "api_version": "v1.41",
 *   "ledger_capacity": 1000,
 *   "pull_timeout_seconds": 300,
 *   "stop_grace_seconds": 2,
 *   "wait_grace_margin_seconds": 5,
 *   "tmpfs_size": "100m",
 *   "container_prefix": "runcage-sandbox",
 *   "workspace_root": "/tmp",
 *   "mount_path": "/sandbox",
 *   "default_limits": {"memory": "512m", "timeout_seconds": 30}
 * }
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/backend_factory.hpp"
#include "runcage/core/resource_limits.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace runcage {
namespace core {

/**
 * @struct EngineConfig
 * @brief Settings shared by every execution of one engine
 */
struct EngineConfig {
    // Backend
    backends::BackendMode backend{backends::BackendMode::AUTO};  ///< Backend selection
    std::string docker_socket{"/var/run/docker.sock"};           ///< API backend socket
    std::string docker_binary{"docker"};                         ///< CLI backend client
    std::string api_version{"v1.41"};                            ///< API path prefix

    // Timing
    std::chrono::seconds pull_timeout{300};      ///< Bound on an image pull
    std::chrono::seconds stop_grace{2};          ///< SIGTERM → SIGKILL delay on stop
    std::chrono::seconds wait_grace_margin{5};   ///< Slack on top of the execution timeout

    // Containers
    std::string tmpfs_size{"100m"};                 ///< Size of /tmp in the container
    std::string container_prefix{"runcage-sandbox"};///< Container name prefix
    std::string mount_path{"/sandbox"};             ///< Workspace mount point
    std::filesystem::path workspace_root;           ///< Workspace parent; temp dir if empty

    // Execution defaults
    std::size_t ledger_capacity{1000};   ///< Retained history entries
    ResourceLimits default_limits;       ///< Limits when a caller gives none
};

/**
 * @class EngineConfigBuilder
 * @brief Fluent construction of EngineConfig
 * 
 * **Usage Example**:
 * @code
 * auto config = EngineConfigBuilder()
 *     .WithBackend(backends::BackendMode::CLI)
 *     .WithLedgerCapacity(100)
 *     .Build();
 * @endcode
 */
class EngineConfigBuilder {
public:
    EngineConfigBuilder() = default;
    explicit EngineConfigBuilder(EngineConfig base) : config_(std::move(base)) {}

    EngineConfigBuilder& WithBackend(backends::BackendMode mode) {
        config_.backend = mode;
        return *this;
    }

    EngineConfigBuilder& WithDockerSocket(const std::string& socket) {
        config_.docker_socket = socket;
        return *this;
    }

    EngineConfigBuilder& WithDockerBinary(const std::string& binary) {
        config_.docker_binary = binary;
        return *this;
    }

    EngineConfigBuilder& WithPullTimeout(std::chrono::seconds timeout) {
        config_.pull_timeout = timeout;
        return *this;
    }

    EngineConfigBuilder& WithStopGrace(std::chrono::seconds grace) {
        config_.stop_grace = grace;
        return *this;
    }

    EngineConfigBuilder& WithWaitGraceMargin(std::chrono::seconds margin) {
        config_.wait_grace_margin = margin;
        return *this;
    }

    EngineConfigBuilder& WithTmpfsSize(const std::string& size) {
        config_.tmpfs_size = size;
        return *this;
    }

    EngineConfigBuilder& WithContainerPrefix(const std::string& prefix) {
        config_.container_prefix = prefix;
        return *this;
    }

    EngineConfigBuilder& WithWorkspaceRoot(const std::filesystem::path& root) {
        config_.workspace_root = root;
        return *this;
    }

    EngineConfigBuilder& WithLedgerCapacity(std::size_t capacity) {
        config_.ledger_capacity = capacity;
        return *this;
    }

    EngineConfigBuilder& WithDefaultLimits(const ResourceLimits& limits) {
        config_.default_limits = limits;
        return *this;
    }

    /// @throws ConfigError if values are inconsistent
    EngineConfig Build() const;

private:
    EngineConfig config_;
};

/**
 * @brief Check configuration values
 * @throws ConfigError on zero capacity, empty prefix, relative mount path...
 */
void ValidateEngineConfig(const EngineConfig& config);

/**
 * @brief Build a configuration from parsed JSON
 * @throws ConfigError on wrong value types or invalid values
 */
EngineConfig ParseEngineConfig(const nlohmann::json& document);

/**
 * @brief Read a JSON configuration file
 * @throws ConfigError if the file is missing, malformed or invalid
 */
EngineConfig LoadEngineConfig(const std::filesystem::path& path);

/**
 * @brief Apply DOCKER_HOST to the socket path
 * 
 * Only unix:// hosts are applied; other schemes are left to the docker CLI,
 * which reads DOCKER_HOST itself.
 */
void ApplyEnvironmentOverrides(EngineConfig& config);

} // namespace core
} // namespace runcage
