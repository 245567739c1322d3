/**
 * @file backend_factory.cpp
 * @brief Container backend selection
 * 
 * @date 2025
 */

#include "runcage/backends/backend_factory.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace runcage {
namespace backends {

const char* BackendModeName(BackendMode mode) {
    switch (mode) {
        case BackendMode::AUTO: return "auto";
        case BackendMode::API: return "api";
        case BackendMode::CLI: return "cli";
    }
    return "unknown";
}

BackendMode ParseBackendMode(const std::string& value) {
    std::string mode = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (mode == "auto") return BackendMode::AUTO;
    if (mode == "api") return BackendMode::API;
    if (mode == "cli") return BackendMode::CLI;
    throw core::ConfigError("Unknown backend '" + value + "' (expected auto, api or cli)");
}

std::unique_ptr<ContainerBackend> CreateBackend(BackendMode mode,
                                                const DockerApiOptions& api_options,
                                                const DockerCliOptions& cli_options) {
    std::string failures;

    if (mode == BackendMode::AUTO || mode == BackendMode::API) {
        auto api = std::make_unique<DockerApiBackend>(api_options);
        auto status = api->Ping();
        if (status.ok()) {
            spdlog::info("Using Docker API backend ({})", api_options.socket_path);
            return api;
        }
        spdlog::warn("Docker API backend unavailable: {}", status.message);
        failures += "api: " + status.message;
    }

    if (mode == BackendMode::AUTO || mode == BackendMode::CLI) {
        auto cli = std::make_unique<DockerCliBackend>(cli_options);
        auto status = cli->Ping();
        if (status.ok()) {
            spdlog::info("Using Docker CLI backend ({})", cli_options.docker_binary);
            return cli;
        }
        spdlog::warn("Docker CLI backend unavailable: {}", status.message);
        if (!failures.empty()) failures += "; ";
        failures += "cli: " + status.message;
    }

    spdlog::error("No container runtime available");
    throw core::EngineError(core::ErrorCode::BACKEND,
                            std::string("No container runtime available (mode ") +
                            BackendModeName(mode) + "): " + failures);
}

} // namespace backends
} // namespace runcage
