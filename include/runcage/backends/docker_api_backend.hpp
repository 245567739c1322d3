/**
 * @file docker_api_backend.hpp
 * @brief Docker Engine REST API backend (libcurl over the unix socket)
 * 
 * Talks HTTP/1.1 to the daemon socket directly. Every request uses its own
 * curl easy handle, so one backend instance can serve concurrent executions.
 * Blocking calls (wait, pull) map their Deadline onto CURLOPT_TIMEOUT_MS.
 * 
 * **Endpoints used** (prefixed with /v1.41):
 * ```
 * GET    /_ping                         Ping
 * GET    /version                       RuntimeVersion
 * GET    /images/{name}/json            ImageExists
 * POST   /images/create?fromImage=..    PullImage
 * POST   /containers/create?name=..     CreateContainer
 * POST   /containers/{id}/start         StartContainer
 * POST   /containers/{id}/wait          WaitContainer
 * POST   /containers/{id}/stop?t=..     StopContainer
 * DELETE /containers/{id}?force=1       RemoveContainer
 * GET    /containers/{id}/logs          FetchLogs (multiplexed stream)
 * GET    /containers/json?all=1&filters ListContainers
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace runcage {
namespace backends {

/**
 * @struct DockerApiOptions
 * @brief Connection settings of the API backend
 */
struct DockerApiOptions {
    std::string socket_path{"/var/run/docker.sock"};  ///< Daemon unix socket
    std::string api_version{"v1.41"};                 ///< API version path prefix
    std::chrono::seconds request_timeout{30};         ///< Bound on non-blocking calls
};

/**
 * @struct DemuxedStreams
 * @brief stdout/stderr split out of a multiplexed log stream
 */
struct DemuxedStreams {
    std::string stdout_bytes;
    std::string stderr_bytes;
    bool truncated{false};  ///< Last frame shorter than its header announced
};

/**
 * @brief Split Docker's multiplexed stream framing
 * 
 * Each frame is an 8-byte header (stream type, 3 zero bytes, big-endian
 * payload length) followed by the payload. Stream 1 is stdout, 2 is stderr.
 * Input that does not start with a valid header (TTY containers) is returned
 * entirely as stdout.
 * 
 * @param raw Response body of /containers/{id}/logs
 * @return Separated streams
 */
DemuxedStreams DemuxDockerStream(const std::string& raw);

/**
 * @class DockerApiBackend
 * @brief ContainerBackend over the Docker Engine API
 */
class DockerApiBackend : public ContainerBackend {
public:
    explicit DockerApiBackend(DockerApiOptions options = DockerApiOptions{});

    std::string Name() const override { return "docker-api"; }

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
     * @brief Request body of POST /containers/create
     * @throws std::invalid_argument if the memory limits are not parseable
     */
    static nlohmann::json BuildCreateBody(const ContainerSpec& spec);

private:
    struct HttpResponse {
        bool transport_ok{false};   ///< Request reached the daemon and completed
        bool timed_out{false};      ///< curl gave up at the deadline
        bool unreachable{false};    ///< Socket connect failed
        std::string transport_error;
        long status{0};
        std::string body;
    };

    HttpResponse Request(const std::string& method,
                         const std::string& path,
                         const std::string& body,
                         const core::Deadline& deadline) const;

    /// Deadline of a short control request
    core::Deadline ControlDeadline() const;

    /// Status for a transport-level failure
    static BackendStatus TransportStatus(const HttpResponse& response, BackendErrorKind fallback);

    DockerApiOptions options_;
};

} // namespace backends
} // namespace runcage
