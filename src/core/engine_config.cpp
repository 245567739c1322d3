/**
 * @file engine_config.cpp
 * @brief Engine configuration loading and validation
 * 
 * @date 2025
 */

#include "runcage/core/engine_config.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace runcage {
namespace core {

namespace {

/// Copy `document[key]` into `out` when present
template <typename T>
void ReadField(const nlohmann::json& document, const char* key, T& out) {
    if (!document.contains(key) || document[key].is_null()) {
        return;
    }
    try {
        out = document[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void ReadSeconds(const nlohmann::json& document, const char* key, std::chrono::seconds& out) {
    long long seconds = out.count();
    ReadField(document, key, seconds);
    if (seconds < 0) {
        throw ConfigError(std::string("'") + key + "' must not be negative");
    }
    out = std::chrono::seconds(seconds);
}

ResourceLimits ParseLimits(const nlohmann::json& document, const ResourceLimits& base) {
    if (!document.is_object()) {
        throw ConfigError("'default_limits' must be an object");
    }

    LimitsRequest request = base.values();
    ReadField(document, "memory", request.memory_limit);
    if (document.contains("memory") && !document.contains("memory_swap")) {
        request.memory_swap_limit.clear();
    }
    ReadField(document, "memory_swap", request.memory_swap_limit);
    ReadField(document, "cpu_quota", request.cpu_quota);
    ReadField(document, "cpu_period", request.cpu_period);
    ReadField(document, "cpu_shares", request.cpu_shares);
    ReadField(document, "pids_limit", request.pids_limit);
    ReadField(document, "timeout_seconds", request.timeout_seconds);
    return ResourceLimits(request);
}

} // anonymous namespace

EngineConfig EngineConfigBuilder::Build() const {
    ValidateEngineConfig(config_);
    return config_;
}

void ValidateEngineConfig(const EngineConfig& config) {
    if (config.ledger_capacity == 0) {
        throw ConfigError("ledger_capacity must be at least 1");
    }
    if (config.container_prefix.empty()) {
        throw ConfigError("container_prefix must not be empty");
    }
    if (config.mount_path.empty() || config.mount_path.front() != '/') {
        throw ConfigError("mount_path must be an absolute container path");
    }
    if (config.docker_binary.empty()) {
        throw ConfigError("docker_binary must not be empty");
    }
    if (config.docker_socket.empty()) {
        throw ConfigError("docker_socket must not be empty");
    }
    if (config.tmpfs_size.empty()) {
        throw ConfigError("tmpfs_size must not be empty");
    }
    try {
        ParseByteSize(config.tmpfs_size);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("tmpfs_size: ") + e.what());
    }
}

EngineConfig ParseEngineConfig(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    EngineConfig config;

    std::string backend = backends::BackendModeName(config.backend);
    ReadField(document, "backend", backend);
    config.backend = backends::ParseBackendMode(backend);

    ReadField(document, "docker_socket", config.docker_socket);
    ReadField(document, "docker_binary", config.docker_binary);
    ReadField(document, "api_version", config.api_version);
    ReadField(document, "ledger_capacity", config.ledger_capacity);
    ReadSeconds(document, "pull_timeout_seconds", config.pull_timeout);
    ReadSeconds(document, "stop_grace_seconds", config.stop_grace);
    ReadSeconds(document, "wait_grace_margin_seconds", config.wait_grace_margin);
    ReadField(document, "tmpfs_size", config.tmpfs_size);
    ReadField(document, "container_prefix", config.container_prefix);
    ReadField(document, "mount_path", config.mount_path);

    std::string workspace_root;
    ReadField(document, "workspace_root", workspace_root);
    config.workspace_root = workspace_root;

    if (document.contains("default_limits")) {
        config.default_limits = ParseLimits(document["default_limits"], config.default_limits);
    }

    ValidateEngineConfig(config);
    return config;
}

EngineConfig LoadEngineConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed configuration " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return ParseEngineConfig(document);
}

void ApplyEnvironmentOverrides(EngineConfig& config) {
    const char* docker_host = std::getenv("DOCKER_HOST");
    if (docker_host == nullptr || *docker_host == '\0') {
        return;
    }

    std::string host = docker_host;
    const std::string scheme = "unix://";
    if (utils::StringUtils::StartsWith(host, scheme)) {
        config.docker_socket = host.substr(scheme.size());
        spdlog::debug("DOCKER_HOST sets socket to {}", config.docker_socket);
    } else {
        spdlog::debug("DOCKER_HOST {} is not a unix socket; API backend keeps {}",
                      host, config.docker_socket);
    }
}

} // namespace core
} // namespace runcage
