/**
 * @file container_lifecycle.cpp
 * @brief Container lifecycle management for one execution
 * 
 * @date 2025
 */

#include "runcage/core/container_lifecycle.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace runcage {
namespace core {

using backends::BackendErrorKind;
using backends::BackendStatus;
using utils::StringUtils;

namespace {

std::string Prefixed(ErrorCode code, const std::string& message) {
    return std::string(ErrorCodeName(code)) + ": " + message;
}

std::string LocalHostName() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "localhost";
    }
    return buffer;
}

/// Keeps a container name in the in-flight set for one Run()
class InFlightEntry {
public:
    InFlightEntry(InFlightContainers& registry, std::string name)
        : registry_(registry), name_(std::move(name)) {
        registry_.Add(name_);
    }
    ~InFlightEntry() { registry_.Remove(name_); }

    InFlightEntry(const InFlightEntry&) = delete;
    InFlightEntry& operator=(const InFlightEntry&) = delete;

private:
    InFlightContainers& registry_;
    std::string name_;
};

} // anonymous namespace

// ============================================================================
// OWNERSHIP
// ============================================================================

std::string ProcessOwnerTag() {
    static const std::string tag = LocalHostName() + "/" + std::to_string(::getpid());
    return tag;
}

bool OwnerIsAlive(const std::string& owner) {
    auto slash = owner.rfind('/');
    if (slash == std::string::npos || slash + 1 >= owner.size()) {
        return true;
    }
    if (owner.substr(0, slash) != LocalHostName()) {
        return true;
    }

    pid_t pid = 0;
    try {
        pid = static_cast<pid_t>(std::stol(owner.substr(slash + 1)));
    } catch (const std::logic_error&) {
        return true;
    }
    if (pid <= 0) {
        return true;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

InFlightContainers& InFlightContainers::Process() {
    static InFlightContainers registry;
    return registry;
}

void InFlightContainers::Add(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_.insert(name);
}

void InFlightContainers::Remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_.erase(name);
}

bool InFlightContainers::Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.count(name) > 0;
}

std::size_t InFlightContainers::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

// ============================================================================
// CONTAINER GUARD
// ============================================================================

ContainerGuard::ContainerGuard(backends::ContainerBackend& backend,
                               std::string container_id,
                               std::chrono::seconds stop_grace)
    : backend_(backend),
      container_id_(std::move(container_id)),
      stop_grace_(stop_grace) {
}

ContainerGuard::~ContainerGuard() {
    Release();
}

void ContainerGuard::Release() {
    if (released_) {
        return;
    }
    released_ = true;

    std::string short_id = StringUtils::ShortId(container_id_);

    if (running_) {
        auto status = backend_.StopContainer(container_id_, stop_grace_);
        if (!status.ok() && status.kind != BackendErrorKind::NOT_FOUND) {
            spdlog::warn("Failed to stop container {}: {}", short_id, status.message);
        }
        running_ = false;
    }

    auto status = backend_.RemoveContainer(container_id_, true);
    if (status.ok()) {
        spdlog::info("Container {} removed", short_id);
    } else if (status.kind == BackendErrorKind::NOT_FOUND) {
        spdlog::debug("Container {} already gone", short_id);
    } else {
        spdlog::warn("Failed to remove container {}: {}", short_id, status.message);
    }
}

// ============================================================================
// LIFECYCLE MANAGER
// ============================================================================

ContainerLifecycleManager::ContainerLifecycleManager(backends::ContainerBackend& backend,
                                                     const EngineConfig& config)
    : backend_(backend),
      config_(config) {
}

std::string ContainerLifecycleManager::GenerateContainerName(const std::string& prefix) {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    std::ostringstream oss;
    oss << prefix << "-" << std::hex << std::setw(12) << std::setfill('0')
        << (dist(generator) & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::map<std::string, std::string> ContainerLifecycleManager::BuildEnvironment(
    const std::map<std::string, std::string>& env) {
    std::map<std::string, std::string> merged = env;
    merged["PYTHONUNBUFFERED"] = "1";
    merged["PYTHONDONTWRITEBYTECODE"] = "1";
    return merged;
}

std::vector<std::string> ContainerLifecycleManager::BuildLaunchCommand(const LanguageSpec& spec,
                                                                       const Workspace& workspace,
                                                                       const std::string& mount_path) {
    std::vector<std::string> argv = spec.launch_command(workspace.main_file());
    if (!workspace.has_stdin()) {
        return argv;
    }

    std::vector<std::string> wrapped = {
        "sh", "-c",
        "exec \"$@\" < " + mount_path + "/" + kStdinFileName,
        "runcage"
    };
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());
    return wrapped;
}

BackendStatus ContainerLifecycleManager::EnsureImage(const std::string& image) {
    auto exists = backend_.ImageExists(image);
    if (exists.ok()) {
        return exists;
    }
    if (exists.kind != BackendErrorKind::NOT_FOUND) {
        spdlog::warn("Image check for {} failed: {}", image, exists.message);
    }

    spdlog::warn("Image {} not present locally, pulling (timeout {}s)",
                 image, config_.pull_timeout.count());
    auto pulled = backend_.PullImage(image, Deadline::After(config_.pull_timeout));
    if (!pulled.ok()) {
        return BackendStatus::Error(BackendErrorKind::IMAGE_UNAVAILABLE,
                                    "Docker image not found: " + image + " (" + pulled.message + ")");
    }

    spdlog::info("Pulled image {}", image);
    return BackendStatus::Ok();
}

void ContainerLifecycleManager::RemovePartialContainer(const std::string& name) {
    auto status = backend_.RemoveContainer(name, true);
    if (status.ok()) {
        spdlog::warn("Removed partially created container {}", name);
    } else if (status.kind == BackendErrorKind::NOT_FOUND) {
        spdlog::debug("No partial container {} to remove", name);
    } else {
        spdlog::warn("Failed to remove partial container {}: {}", name, status.message);
    }
}

ExecutionOutcome ContainerLifecycleManager::Run(const LanguageSpec& spec,
                                                const Workspace& workspace,
                                                const IsolationSpec& isolation,
                                                const std::map<std::string, std::string>& env,
                                                std::chrono::seconds timeout) {
    ExecutionOutcome outcome;
    outcome.timeout_seconds = static_cast<int>(timeout.count());

    // Step 1: Image
    auto image_status = EnsureImage(spec.image);
    if (!image_status.ok()) {
        spdlog::error("Image unavailable: {}", image_status.message);
        outcome.infra_error = Prefixed(ErrorCode::IMAGE_UNAVAILABLE, image_status.message);
        return outcome;
    }

    // Step 2: Create
    backends::ContainerSpec container;
    container.image = spec.image;
    container.command = BuildLaunchCommand(spec, workspace, config_.mount_path);
    container.name = GenerateContainerName(config_.container_prefix);
    container.labels = {{kManagedLabel, "true"},
                        {kLanguageLabel, spec.id},
                        {kOwnerLabel, ProcessOwnerTag()}};
    container.mounts.push_back({workspace.path().string(), config_.mount_path, true});
    container.working_dir = config_.mount_path;
    container.env = BuildEnvironment(env);
    container.isolation = isolation;

    spdlog::debug("Container command: {}", StringUtils::FormatCommandLine(container.command));
    spdlog::debug("Isolation: {}", isolation.Describe());

    InFlightEntry in_flight(InFlightContainers::Process(), container.name);

    auto created = backend_.CreateContainer(container);
    if (!created.status.ok()) {
        spdlog::error("Failed to create container for {} ({}): {}", spec.id,
                      backends::BackendErrorKindName(created.status.kind), created.status.message);
        // The daemon may have created it after the client gave up
        if (created.status.kind == BackendErrorKind::TIMEOUT ||
            created.status.kind == BackendErrorKind::PROTOCOL ||
            created.status.kind == BackendErrorKind::DAEMON_UNREACHABLE) {
            RemovePartialContainer(container.name);
        }
        outcome.infra_error = Prefixed(ErrorCode::CONTAINER_CREATE, created.status.message);
        return outcome;
    }

    ContainerGuard guard(backend_, created.container_id, config_.stop_grace);
    outcome.container_id = created.container_id;
    std::string short_id = StringUtils::ShortId(created.container_id);
    spdlog::info("Container {} created ({})", short_id, container.name);

    // Step 3: Start
    auto deadline = Deadline::After(timeout);
    auto started = backend_.StartContainer(created.container_id);
    if (!started.ok()) {
        spdlog::error("Failed to start container {}: {}", short_id, started.message);
        outcome.infra_error = Prefixed(ErrorCode::CONTAINER_START, started.message);
        return outcome;
    }
    spdlog::info("Container {} started (timeout {}s)", short_id, timeout.count());

    // Step 4: Wait
    auto waited = backend_.WaitContainer(created.container_id, deadline);

    // A backend that returns after the deadline plus margin overran its bound
    if (waited.status.ok() && deadline.Extended(config_.wait_grace_margin).Expired()) {
        spdlog::warn("Backend wait for {} overran deadline plus margin", short_id);
        waited.status = BackendStatus::Error(BackendErrorKind::TIMEOUT, "wait overran deadline");
    }

    if (waited.status.kind == BackendErrorKind::TIMEOUT) {
        spdlog::warn("Execution timed out after {}s, stopping {}", timeout.count(), short_id);
        auto stopped = backend_.StopContainer(created.container_id, config_.stop_grace);
        if (stopped.ok()) {
            guard.MarkStopped();
        } else {
            spdlog::warn("Failed to stop timed out container {}: {}", short_id, stopped.message);
        }

        outcome.timed_out = true;
        outcome.exit_code = kTimeoutExitCode;

        auto logs = backend_.FetchLogs(created.container_id);
        if (logs.status.ok()) {
            outcome.stdout_bytes = std::move(logs.stdout_bytes);
            outcome.stderr_bytes = std::move(logs.stderr_bytes);
        } else {
            spdlog::warn("No partial output for {}: {}", short_id, logs.status.message);
        }
        return outcome;
    }

    if (!waited.status.ok()) {
        spdlog::error("Waiting for container {} failed: {}", short_id, waited.status.message);
        outcome.infra_error = Prefixed(ErrorCode::BACKEND, "wait failed: " + waited.status.message);
        return outcome;
    }

    guard.MarkStopped();
    outcome.exit_code = waited.exit_code;

    // Step 5: Logs, read only after exit
    auto logs = backend_.FetchLogs(created.container_id);
    if (!logs.status.ok()) {
        spdlog::error("Failed to fetch logs of {} (exit code {}): {}",
                      short_id, outcome.exit_code, logs.status.message);
        outcome.exit_code = kInfraErrorExitCode;
        outcome.infra_error = Prefixed(ErrorCode::BACKEND, "log retrieval failed: " + logs.status.message);
        return outcome;
    }
    outcome.stdout_bytes = std::move(logs.stdout_bytes);
    outcome.stderr_bytes = std::move(logs.stderr_bytes);

    spdlog::info("Container {} exited with code {}", short_id, outcome.exit_code);
    return outcome;
}

} // namespace core
} // namespace runcage
