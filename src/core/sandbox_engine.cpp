/**
 * @file sandbox_engine.cpp
 * @brief Sandbox engine pipeline
 * 
 * @date 2025
 */

#include "runcage/core/sandbox_engine.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/core/isolation_policy.hpp"
#include "runcage/core/result_assembler.hpp"
#include "runcage/core/workspace.hpp"
#include "runcage/utils/hash_utils.hpp"
#include "runcage/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace runcage {
namespace core {

namespace {

std::unique_ptr<backends::ContainerBackend> RequireBackend(
    std::unique_ptr<backends::ContainerBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("SandboxEngine requires a container backend");
    }
    return backend;
}

EngineConfig Validated(EngineConfig config) {
    ValidateEngineConfig(config);
    return config;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

EngineConfig SandboxEngine::PrepareConfig(EngineConfig config) {
    ApplyEnvironmentOverrides(config);
    ValidateEngineConfig(config);
    return config;
}

std::unique_ptr<backends::ContainerBackend> SandboxEngine::SelectBackend(const EngineConfig& config) {
    backends::DockerApiOptions api_options;
    api_options.socket_path = config.docker_socket;
    api_options.api_version = config.api_version;

    backends::DockerCliOptions cli_options;
    cli_options.docker_binary = config.docker_binary;

    return backends::CreateBackend(config.backend, api_options, cli_options);
}

SandboxEngine::SandboxEngine(EngineConfig config)
    : config_(PrepareConfig(std::move(config))),
      registry_(LanguageRegistry::Default()),
      backend_(SelectBackend(config_)),
      lifecycle_(*backend_, config_),
      ledger_(config_.ledger_capacity) {
    spdlog::info("Sandbox engine ready (backend: {})", backend_->Name());
}

SandboxEngine::SandboxEngine(EngineConfig config,
                             std::unique_ptr<backends::ContainerBackend> backend,
                             LanguageRegistry registry)
    : config_(Validated(std::move(config))),
      registry_(std::move(registry)),
      backend_(RequireBackend(std::move(backend))),
      lifecycle_(*backend_, config_),
      ledger_(config_.ledger_capacity) {
    spdlog::debug("Sandbox engine ready (backend: {})", backend_->Name());
}

SandboxEngine::~SandboxEngine() = default;

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult SandboxEngine::Execute(const ExecutionRequest& request) {
    auto start = std::chrono::steady_clock::now();

    const LanguageSpec* spec = nullptr;
    try {
        spec = &registry_.Require(request.language);
    } catch (const UnsupportedLanguageError& e) {
        spdlog::error("{}", e.what());
        throw;
    }

    ResourceLimits limits = NormalizeLimits(request.limits);
    spdlog::info("Executing {} code ({} bytes, timeout {}s, network {})",
                 spec->id, request.code.size(), limits.timeout_seconds(),
                 request.network_enabled ? "on" : "off");

    Workspace workspace = StageWorkspace(request, *spec, config_.workspace_root);

    IsolationDefaults defaults;
    defaults.tmpfs_size = config_.tmpfs_size;
    IsolationSpec isolation = DeriveIsolation(request, limits, defaults);

    ExecutionOutcome outcome;
    try {
        outcome = lifecycle_.Run(*spec, workspace, isolation, request.env_vars, limits.timeout());
    } catch (const std::exception& e) {
        spdlog::error("Execution of {} code failed: {}", spec->id, e.what());
        outcome = ExecutionOutcome{};
        outcome.infra_error = std::string(ErrorCodeName(ErrorCode::BACKEND)) + ": " + e.what();
    }

    workspace.Release();

    std::string requested = utils::StringUtils::ToLower(utils::StringUtils::Trim(request.language));
    auto result = AssembleResult(outcome, requested, spec->display_name,
                                 std::chrono::steady_clock::now() - start);
    RecordExecution(request.code, result);

    if (result.success) {
        spdlog::info("Execution succeeded in {:.3f}s", result.execution_time_seconds);
    } else if (result.timed_out) {
        spdlog::warn("Execution timed out after {}s", limits.timeout_seconds());
    } else if (result.error_message) {
        spdlog::error("Execution failed: {}", *result.error_message);
    } else {
        spdlog::info("Program exited with code {} in {:.3f}s",
                     result.exit_code, result.execution_time_seconds);
    }

    return result;
}

ExecutionResult SandboxEngine::ExecuteWithInput(const std::string& code,
                                                const std::string& language,
                                                const std::string& stdin_input,
                                                const std::optional<ResourceLimits>& limits) {
    ExecutionRequest request;
    request.code = code;
    request.language = language;
    request.limits = limits.value_or(config_.default_limits);
    request.stdin_input = stdin_input;
    return Execute(request);
}

ExecutionResult SandboxEngine::ExecuteTests(const std::string& code,
                                            const std::string& test_code,
                                            const std::string& language,
                                            const std::optional<ResourceLimits>& limits) {
    ExecutionRequest request;
    request.code = code + "\n\n" + test_code;
    request.language = language;
    request.limits = limits.value_or(config_.default_limits);

    auto result = Execute(request);
    spdlog::info("Tests {}", result.success ? "passed" : "failed");
    return result;
}

void SandboxEngine::RecordExecution(const std::string& code, const ExecutionResult& result) {
    ExecutionLedgerEntry entry;
    entry.timestamp = result.timestamp;
    entry.language = result.language;
    entry.success = result.success;
    entry.exit_code = result.exit_code;
    entry.execution_time_seconds = result.execution_time_seconds;
    entry.container_id = result.container_id;

    try {
        entry.code_sha256 = utils::HashUtils::Sha256Hex(code);
    } catch (const std::runtime_error& e) {
        spdlog::warn("Could not hash submitted code: {}", e.what());
    }

    ledger_.Record(std::move(entry));
}

// ============================================================================
// INTROSPECTION AND HYGIENE
// ============================================================================

std::vector<LanguageInfo> SandboxEngine::ListSupportedLanguages() const {
    return registry_.ListLanguages();
}

std::vector<ExecutionLedgerEntry> SandboxEngine::RecentExecutions(std::size_t limit) const {
    return ledger_.Recent(limit);
}

std::size_t SandboxEngine::CleanupOrphans() {
    std::string filter = std::string(kManagedLabel) + "=true";
    auto listed = backend_->ListContainers(filter);
    if (!listed.status.ok()) {
        spdlog::error("Cannot list managed containers: {}", listed.status.message);
        return 0;
    }

    std::size_t removed = 0;
    std::size_t skipped = 0;
    for (const auto& container : listed.containers) {
        std::string short_id = utils::StringUtils::ShortId(container.id);
        if (lifecycle_.in_flight().Contains(container.name)) {
            spdlog::debug("Skipping {}: execution still running", short_id);
            ++skipped;
            continue;
        }
        auto owner = container.labels.find(kOwnerLabel);
        if (owner != container.labels.end() && owner->second != ProcessOwnerTag() &&
            OwnerIsAlive(owner->second)) {
            spdlog::debug("Skipping {}: owner {} is alive", short_id, owner->second);
            ++skipped;
            continue;
        }

        auto status = backend_->RemoveContainer(container.id, true);
        if (status.ok()) {
            ++removed;
            spdlog::info("Removed orphaned container {} ({})", short_id, container.name);
        } else {
            spdlog::warn("Failed to remove orphaned container {}: {}", short_id, status.message);
        }
    }

    spdlog::info("Cleanup removed {} of {} managed containers ({} in use)",
                 removed, listed.containers.size(), skipped);
    return removed;
}

std::string SandboxEngine::BackendName() const {
    return backend_->Name();
}

std::optional<std::string> SandboxEngine::RuntimeVersion() {
    return backend_->RuntimeVersion();
}

} // namespace core
} // namespace runcage
