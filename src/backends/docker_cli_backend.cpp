/**
 * @file docker_cli_backend.cpp
 * @brief docker CLI backend implementation
 * 
 * @date 2025
 */

#include "runcage/backends/docker_cli_backend.hpp"
#include "runcage/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

namespace runcage {
namespace backends {

using utils::StringUtils;

DockerCliBackend::DockerCliBackend(DockerCliOptions options)
    : options_(std::move(options)) {
    spdlog::debug("Docker CLI backend using '{}'", options_.docker_binary);
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

utils::SubprocessResult DockerCliBackend::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                               const core::Deadline& deadline) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.docker_binary);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::FormatCommandLine(argv));

    utils::SubprocessOptions sub_options;
    sub_options.deadline = deadline;
    return utils::RunSubprocess(argv, sub_options);
}

utils::SubprocessResult DockerCliBackend::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    return ExecuteDockerCommand(args, core::Deadline::After(options_.command_timeout));
}

BackendStatus DockerCliBackend::FailureStatus(const utils::SubprocessResult& result,
                                              BackendErrorKind fallback) {
    if (result.spawn_failed) {
        return BackendStatus::Error(BackendErrorKind::DAEMON_UNREACHABLE, result.error);
    }
    if (result.timed_out) {
        return BackendStatus::Error(BackendErrorKind::TIMEOUT, "docker command timed out");
    }

    std::string message = StringUtils::Trim(result.stderr_output);
    if (message.find("Cannot connect to the Docker daemon") != std::string::npos ||
        message.find("Is the docker daemon running") != std::string::npos) {
        return BackendStatus::Error(BackendErrorKind::DAEMON_UNREACHABLE, message);
    }
    if (message.find("No such") != std::string::npos) {
        return BackendStatus::Error(BackendErrorKind::NOT_FOUND, message);
    }
    if (message.empty()) {
        message = "docker exited with code " + std::to_string(result.exit_code);
    }
    return BackendStatus::Error(fallback, message);
}

// ============================================================================
// DAEMON / IMAGES
// ============================================================================

BackendStatus DockerCliBackend::Ping() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       core::Deadline::After(std::chrono::seconds(10)));
    if (!result.success()) {
        return FailureStatus(result, BackendErrorKind::DAEMON_UNREACHABLE);
    }
    return BackendStatus::Ok();
}

std::optional<std::string> DockerCliBackend::RuntimeVersion() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"});
    if (!result.success()) {
        return std::nullopt;
    }
    std::string version = StringUtils::Trim(result.stdout_output);
    if (version.empty()) {
        return std::nullopt;
    }
    return version;
}

BackendStatus DockerCliBackend::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image});
    if (result.success()) {
        return BackendStatus::Ok();
    }
    return FailureStatus(result, BackendErrorKind::PROTOCOL);
}

BackendStatus DockerCliBackend::PullImage(const std::string& image, const core::Deadline& deadline) {
    spdlog::info("Pulling image {} via CLI", image);
    auto result = ExecuteDockerCommand({"pull", "--quiet", image}, deadline);
    if (result.success()) {
        return BackendStatus::Ok();
    }

    auto status = FailureStatus(result, BackendErrorKind::IMAGE_UNAVAILABLE);
    if (status.kind == BackendErrorKind::TIMEOUT || status.kind == BackendErrorKind::NOT_FOUND) {
        status.kind = BackendErrorKind::IMAGE_UNAVAILABLE;
    }
    return status;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::vector<std::string> DockerCliBackend::BuildCreateArgs(const ContainerSpec& spec) {
    const auto& iso = spec.isolation;
    std::vector<std::string> args;

    args.push_back("create");

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Network mode
    args.push_back("--network");
    args.push_back(iso.network_mode);

    // Read-only root filesystem
    if (iso.read_only_rootfs) {
        args.push_back("--read-only");
    }
    if (iso.init_process) {
        args.push_back("--init");
    }

    // Security: Drop capabilities
    for (const auto& cap : iso.cap_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    for (const auto& opt : iso.security_opt) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    if (!iso.tmpfs_path.empty()) {
        args.push_back("--tmpfs");
        args.push_back(iso.tmpfs_path + ":" + iso.tmpfs_options);
    }

    // Resource limits
    args.push_back("--memory");
    args.push_back(iso.memory);
    args.push_back("--memory-swap");
    args.push_back(iso.memory_swap);
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(iso.cpu_quota));
    args.push_back("--cpu-period");
    args.push_back(std::to_string(iso.cpu_period));
    args.push_back("--cpu-shares");
    args.push_back(std::to_string(iso.cpu_shares));
    args.push_back("--pids-limit");
    args.push_back(std::to_string(iso.pids_limit));

    // Volume mounts
    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ":rw"));
    }

    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }

    for (const auto& [key, value] : spec.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

CreateResult DockerCliBackend::CreateContainer(const ContainerSpec& spec) {
    CreateResult result;

    auto output = ExecuteDockerCommand(BuildCreateArgs(spec));
    if (!output.success()) {
        result.status = FailureStatus(output, BackendErrorKind::CREATE_FAILED);
        if (result.status.kind == BackendErrorKind::NOT_FOUND) {
            result.status.kind = BackendErrorKind::CREATE_FAILED;
        }
        return result;
    }

    // docker create prints pull progress on stderr and the id last on stdout
    auto lines = StringUtils::Split(output.stdout_output, '\n');
    std::string container_id = lines.empty() ? "" : StringUtils::Trim(lines.back());
    if (container_id.empty()) {
        result.status = BackendStatus::Error(BackendErrorKind::PROTOCOL, "docker create printed no id");
        return result;
    }

    result.container_id = container_id;
    return result;
}

BackendStatus DockerCliBackend::StartContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"start", container_id});
    if (!result.success()) {
        auto status = FailureStatus(result, BackendErrorKind::START_FAILED);
        if (status.kind == BackendErrorKind::NOT_FOUND) {
            status.kind = BackendErrorKind::START_FAILED;
        }
        return status;
    }
    return BackendStatus::Ok();
}

WaitResult DockerCliBackend::WaitContainer(const std::string& container_id,
                                           const core::Deadline& deadline) {
    WaitResult wait;

    auto result = ExecuteDockerCommand({"wait", container_id}, deadline);
    if (result.timed_out) {
        wait.status = BackendStatus::Error(BackendErrorKind::TIMEOUT, "Deadline reached while waiting");
        return wait;
    }
    if (!result.success()) {
        wait.status = FailureStatus(result, BackendErrorKind::WAIT_FAILED);
        return wait;
    }

    std::string text = StringUtils::Trim(result.stdout_output);
    try {
        std::size_t consumed = 0;
        wait.exit_code = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        wait.status = BackendStatus::Error(BackendErrorKind::PROTOCOL,
                                           "Unexpected docker wait output: '" + text + "'");
    }
    return wait;
}

BackendStatus DockerCliBackend::StopContainer(const std::string& container_id,
                                              std::chrono::seconds grace) {
    auto result = ExecuteDockerCommand({"stop", "--time", std::to_string(grace.count()), container_id},
                                       core::Deadline::After(grace + options_.command_timeout));
    if (!result.success()) {
        return FailureStatus(result, BackendErrorKind::PROTOCOL);
    }
    return BackendStatus::Ok();
}

BackendStatus DockerCliBackend::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    if (!result.success()) {
        return FailureStatus(result, BackendErrorKind::PROTOCOL);
    }
    return BackendStatus::Ok();
}

LogsResult DockerCliBackend::FetchLogs(const std::string& container_id) {
    LogsResult logs;

    auto result = ExecuteDockerCommand({"logs", container_id});
    if (!result.success()) {
        logs.status = FailureStatus(result, BackendErrorKind::PROTOCOL);
        return logs;
    }

    // The client replays container stdout/stderr on its own stdout/stderr
    logs.stdout_bytes = std::move(result.stdout_output);
    logs.stderr_bytes = std::move(result.stderr_output);
    return logs;
}

// ============================================================================
// LISTING
// ============================================================================

std::optional<ContainerSummary> DockerCliBackend::ParsePsLine(const std::string& line) {
    auto parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    auto text = [&parsed](const char* key) {
        return parsed.contains(key) && parsed[key].is_string() ? parsed[key].get<std::string>()
                                                               : std::string();
    };

    ContainerSummary summary;
    summary.id = text("ID");
    summary.name = text("Names");
    summary.image = text("Image");
    summary.state = text("State");
    if (summary.id.empty()) {
        return std::nullopt;
    }

    // Labels come as "k1=v1,k2=v2"
    for (const auto& pair : StringUtils::Split(text("Labels"), ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            summary.labels[pair] = "";
        } else {
            summary.labels[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }

    return summary;
}

ListResult DockerCliBackend::ListContainers(const std::string& label_filter) {
    ListResult list;

    auto result = ExecuteDockerCommand({"ps", "--all", "--no-trunc",
                                        "--filter", "label=" + label_filter,
                                        "--format", "{{json .}}"});
    if (!result.success()) {
        list.status = FailureStatus(result, BackendErrorKind::PROTOCOL);
        return list;
    }

    std::istringstream lines(result.stdout_output);
    std::string line;
    while (std::getline(lines, line)) {
        line = StringUtils::Trim(line);
        if (line.empty()) {
            continue;
        }
        if (auto summary = ParsePsLine(line)) {
            list.containers.push_back(std::move(*summary));
        } else {
            spdlog::warn("Ignoring unparseable docker ps line: {}", line);
        }
    }

    return list;
}

} // namespace backends
} // namespace runcage
