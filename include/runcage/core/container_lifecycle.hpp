/**
 * @file container_lifecycle.hpp
 * @brief Image → create → start → wait → logs → remove for one execution
 * 
 * **Lifecycle**:
 * ```
 * EnsureImage ─fail→ ImageUnavailable
 *   → CreateContainer ─fail→ ContainerCreationFailed
 *   → ContainerGuard (stop + force remove on every exit path)
 *   → StartContainer ─fail→ ContainerStartFailed
 *   → WaitContainer(deadline)
 *        ├─ exited     → FetchLogs → exit code
 *        ├─ deadline   → StopContainer → FetchLogs (partial) → 124
 *        └─ error      → BackendError
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"
#include "runcage/core/engine_config.hpp"
#include "runcage/core/execution_types.hpp"
#include "runcage/core/isolation_policy.hpp"
#include "runcage/core/language_registry.hpp"
#include "runcage/core/workspace.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace runcage {
namespace core {

/// Label carried by every container the engine creates
constexpr const char* kManagedLabel = "runcage.managed";
constexpr const char* kLanguageLabel = "runcage.language";
/// "<hostname>/<pid>" of the process that created the container
constexpr const char* kOwnerLabel = "runcage.owner";

/// Owner tag of this process, as stored in kOwnerLabel
std::string ProcessOwnerTag();

/**
 * @brief Whether the process named by an owner tag may still be running
 * 
 * Tags from another host cannot be checked and count as alive, as do
 * malformed tags.
 */
bool OwnerIsAlive(const std::string& owner);

/**
 * @class InFlightContainers
 * @brief Names of containers whose execution has not returned yet
 * 
 * A name is added before the create request is sent and removed after the
 * container has been released. Every engine in the process shares one set.
 */
class InFlightContainers {
public:
    static InFlightContainers& Process();

    void Add(const std::string& name);
    void Remove(const std::string& name);
    bool Contains(const std::string& name) const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> names_;
};

/**
 * @class ContainerGuard
 * @brief Owns one created container until it is removed
 * 
 * The destructor stops the container unless it is known to have exited,
 * then force-removes it. Failures are logged, never thrown.
 */
class ContainerGuard {
public:
    ContainerGuard(backends::ContainerBackend& backend,
                   std::string container_id,
                   std::chrono::seconds stop_grace);
    ~ContainerGuard();

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    const std::string& id() const { return container_id_; }

    /// Container is no longer running; skip the stop on release
    void MarkStopped() { running_ = false; }

    /// Stop (if needed) and remove now; later calls do nothing
    void Release();

private:
    backends::ContainerBackend& backend_;
    std::string container_id_;
    std::chrono::seconds stop_grace_;
    bool running_{true};
    bool released_{false};
};

/**
 * @class ContainerLifecycleManager
 * @brief Runs one staged workspace in one fresh container
 * 
 * Holds no per-execution state; one manager serves concurrent runs.
 */
class ContainerLifecycleManager {
public:
    ContainerLifecycleManager(backends::ContainerBackend& backend, const EngineConfig& config);

    /**
     * @brief Execute a staged workspace
     * @param spec Resolved language
     * @param workspace Staged files, mounted read-only
     * @param isolation Isolation and resource parameters
     * @param env Caller environment variables
     * @param timeout Normalized wall-clock timeout
     * @return Raw outcome; never throws for runtime failures
     */
    ExecutionOutcome Run(const LanguageSpec& spec,
                         const Workspace& workspace,
                         const IsolationSpec& isolation,
                         const std::map<std::string, std::string>& env,
                         std::chrono::seconds timeout);

    /**
     * @brief Make sure an image is present locally, pulling it if needed
     * @return ok() or IMAGE_UNAVAILABLE
     */
    backends::BackendStatus EnsureImage(const std::string& image);

    /**
     * @brief In-container argv for a workspace
     * 
     * The language's launch command on the main file, wrapped in
     * `sh -c 'exec "$@" < <mount>/.runcage_stdin'` when stdin was staged.
     */
    static std::vector<std::string> BuildLaunchCommand(const LanguageSpec& spec,
                                                       const Workspace& workspace,
                                                       const std::string& mount_path);

    /// Environment passed to the container: caller vars plus fixed ones
    static std::map<std::string, std::string> BuildEnvironment(
        const std::map<std::string, std::string>& env);

    /// "<prefix>-<12 random hex>"
    static std::string GenerateContainerName(const std::string& prefix);

    const InFlightContainers& in_flight() const { return InFlightContainers::Process(); }

private:
    /// Best-effort removal by name after a create whose result is unknown
    void RemovePartialContainer(const std::string& name);

    backends::ContainerBackend& backend_;
    EngineConfig config_;
};

} // namespace core
} // namespace runcage
