/**
 * @file docker_cli_backend.hpp
 * @brief Container backend driving the docker command-line client
 * 
 * Fallback when the daemon socket is not reachable directly (remote
 * contexts, rootless setups with a CLI wrapper). Each operation spawns the
 * docker binary through RunSubprocess(): no shell, separate stdout/stderr
 * pipes, and the operation's Deadline enforced by killing the client.
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"
#include "runcage/utils/subprocess.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace runcage {
namespace backends {

/**
 * @struct DockerCliOptions
 * @brief Settings of the CLI backend
 */
struct DockerCliOptions {
    std::string docker_binary{"docker"};       ///< Client executable, looked up on PATH
    std::chrono::seconds command_timeout{30};  ///< Bound on non-blocking commands
};

/**
 * @class DockerCliBackend
 * @brief ContainerBackend over `docker` subprocesses
 */
class DockerCliBackend : public ContainerBackend {
public:
    explicit DockerCliBackend(DockerCliOptions options = DockerCliOptions{});

    std::string Name() const override { return "docker-cli"; }

    BackendStatus Ping() override;
    std::optional<std::string> RuntimeVersion() override;
    BackendStatus ImageExists(const std::string& image) override;
    BackendStatus PullImage(const std::string& image, const core::Deadline& deadline) override;
    CreateResult CreateContainer(const ContainerSpec& spec) override;
    BackendStatus StartContainer(const std::string& container_id) override;
    WaitResult WaitContainer(const std::string& container_id,
                             const core::Deadline& deadline) override;
    BackendStatus StopContainer(const std::string& container_id,
                                std::chrono::seconds grace) override;
    BackendStatus RemoveContainer(const std::string& container_id, bool force) override;
    LogsResult FetchLogs(const std::string& container_id) override;
    ListResult ListContainers(const std::string& label_filter) override;

    /**
     * @brief Arguments of `docker create` for a container spec
     * 
     * Starts with "create"; the binary itself is not included.
     * 
     * **Example**:
     * ```
     * create --name runcage-sandbox-1a2b --label runcage.managed=true
     *        --network none --read-only --cap-drop ALL
     *        --security-opt no-new-privileges
     *        --tmpfs /tmp:size=100m,noexec,nosuid,nodev
     *        --memory 512m --memory-swap 512m --cpu-quota 100000
     *        --cpu-period 100000 --cpu-shares 1024 --pids-limit 100
     *        -v /tmp/runcage-ws-abc:/sandbox:ro -w /sandbox
     *        -e PYTHONUNBUFFERED=1 python:3.11-slim python code.py
     * ```
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec);

    /// Parse one `docker ps --format '{{json .}}'` line
    static std::optional<ContainerSummary> ParsePsLine(const std::string& line);

private:
    utils::SubprocessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                                 const core::Deadline& deadline) const;

    utils::SubprocessResult ExecuteDockerCommand(const std::vector<std::string>& args) const;

    /// Map a failed docker invocation to a status
    static BackendStatus FailureStatus(const utils::SubprocessResult& result,
                                       BackendErrorKind fallback);

    DockerCliOptions options_;
};

} // namespace backends
} // namespace runcage
