/**
 * @file container_backend.hpp
 * @brief Abstract container runtime used by the lifecycle manager
 * 
 * Two implementations exist, DockerApiBackend (Docker Engine REST API over
 * the unix socket) and DockerCliBackend (docker CLI subprocesses); tests
 * provide in-memory fakes. Exactly one is chosen when the engine is built.
 * 
 * No exception crosses this interface: every fallible operation reports a
 * BackendStatus. Implementations must be safe to call from several threads
 * at once.
 * 
 * @date 2025
 */

#pragma once

#include "runcage/core/deadline.hpp"
#include "runcage/core/isolation_policy.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runcage {
namespace backends {

/**
 * @enum BackendErrorKind
 * @brief Failure classes reported by container backends
 */
enum class BackendErrorKind {
    NONE,                ///< Success
    IMAGE_UNAVAILABLE,   ///< Image missing and could not be pulled
    CREATE_FAILED,       ///< Container creation rejected
    START_FAILED,        ///< Container start rejected
    WAIT_FAILED,         ///< Waiting for exit failed
    TIMEOUT,             ///< Deadline reached before completion
    DAEMON_UNREACHABLE,  ///< Runtime not answering
    NOT_FOUND,           ///< Object does not exist
    PROTOCOL             ///< Unexpected response from the runtime
};

const char* BackendErrorKindName(BackendErrorKind kind);

/**
 * @struct BackendStatus
 * @brief Outcome of one backend operation
 */
struct BackendStatus {
    BackendErrorKind kind{BackendErrorKind::NONE};
    std::string message;

    bool ok() const { return kind == BackendErrorKind::NONE; }

    static BackendStatus Ok() { return BackendStatus{}; }
    static BackendStatus Error(BackendErrorKind kind, std::string message) {
        return BackendStatus{kind, std::move(message)};
    }
};

/**
 * @struct MountSpec
 * @brief Host directory bind-mounted into the container
 */
struct MountSpec {
    std::string host_path;
    std::string container_path;
    bool read_only{true};
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to create a sandbox container
 */
struct ContainerSpec {
    std::string image;                              ///< Runtime image
    std::vector<std::string> command;               ///< argv run in the container
    std::string name;                               ///< Unique container name
    std::map<std::string, std::string> labels;      ///< Container labels
    std::vector<MountSpec> mounts;                  ///< Bind mounts
    std::string working_dir;                        ///< Initial working directory
    std::map<std::string, std::string> env;         ///< Environment variables
    core::IsolationSpec isolation;                  ///< Security and resource limits
};

struct CreateResult {
    BackendStatus status;
    std::string container_id;  ///< Set on success
};

struct WaitResult {
    BackendStatus status;      ///< TIMEOUT when the deadline passed first
    int exit_code{-1};
};

struct LogsResult {
    BackendStatus status;
    std::string stdout_bytes;
    std::string stderr_bytes;
};

/**
 * @struct ContainerSummary
 * @brief One entry of ListContainers()
 */
struct ContainerSummary {
    std::string id;
    std::string name;
    std::string image;
    std::string state;
    std::map<std::string, std::string> labels;
};

struct ListResult {
    BackendStatus status;
    std::vector<ContainerSummary> containers;
};

/**
 * @class ContainerBackend
 * @brief Container runtime operations needed by the engine
 */
class ContainerBackend {
public:
    virtual ~ContainerBackend() = default;

    /// Short backend name for logs ("docker-api", "docker-cli")
    virtual std::string Name() const = 0;

    /// Check that the runtime answers
    virtual BackendStatus Ping() = 0;

    /// Runtime server version, if it can be queried
    virtual std::optional<std::string> RuntimeVersion() = 0;

    /// ok() if present locally, NOT_FOUND if missing, other kinds on error
    virtual BackendStatus ImageExists(const std::string& image) = 0;

    virtual BackendStatus PullImage(const std::string& image, const core::Deadline& deadline) = 0;

    virtual CreateResult CreateContainer(const ContainerSpec& spec) = 0;

    virtual BackendStatus StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Block until the container exits or the deadline passes
     * @return exit code, or status TIMEOUT when the deadline was reached
     */
    virtual WaitResult WaitContainer(const std::string& container_id,
                                     const core::Deadline& deadline) = 0;

    /// Stop with SIGTERM, then SIGKILL after `grace`
    virtual BackendStatus StopContainer(const std::string& container_id,
                                        std::chrono::seconds grace) = 0;

    virtual BackendStatus RemoveContainer(const std::string& container_id, bool force) = 0;

    /// Complete stdout/stderr of a container, kept apart
    virtual LogsResult FetchLogs(const std::string& container_id) = 0;

    /// All containers (running or not) carrying `label_filter` ("key=value")
    virtual ListResult ListContainers(const std::string& label_filter) = 0;
};

} // namespace backends
} // namespace runcage
