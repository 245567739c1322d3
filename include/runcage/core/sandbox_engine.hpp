/**
 * @file sandbox_engine.hpp
 * @brief Public entry point for sandboxed code execution
 * 
 * Ties the pipeline together for each request:
 * ```
 * LanguageRegistry::Require   (UnsupportedLanguageError)
 *   → NormalizeLimits
 *   → StageWorkspace          (WorkspaceError)
 *   → DeriveIsolation
 *   → ContainerLifecycleManager::Run
 *   → AssembleResult → ExecutionLedger
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"
#include "runcage/core/container_lifecycle.hpp"
#include "runcage/core/engine_config.hpp"
#include "runcage/core/execution_ledger.hpp"
#include "runcage/core/execution_types.hpp"
#include "runcage/core/language_registry.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace runcage {
namespace core {

/**
 * @class SandboxEngine
 * @brief Runs untrusted code snippets in disposable containers
 * 
 * Every Execute() call gets its own workspace, container and deadline; the
 * backend is stateless and the ledger is locked internally, so one engine
 * can serve concurrent callers.
 * 
 * **Thread Safety**: Execute() and the introspection methods may be called
 * from several threads at once.
 * 
 * **Usage Example**:
 * @code
 * SandboxEngine engine(EngineConfigBuilder().WithLedgerCapacity(100).Build());
 * 
 * ExecutionRequest request;
 * request.code = "print(sum(range(10)))";
 * request.language = "python";
 * request.limits = ResourceLimits::Builder().WithTimeoutSeconds(5).Build();
 * 
 * auto result = engine.Execute(request);
 * if (result.success) {
 *     std::cout << result.stdout_output;   // "45\n"
 * }
 * @endcode
 */
class SandboxEngine {
public:
    /**
     * @brief Build an engine and select its backend
     * 
     * Applies DOCKER_HOST, then probes the backend named by config.backend.
     * 
     * @throws ConfigError on invalid configuration
     * @throws EngineError if no container runtime answers
     */
    explicit SandboxEngine(EngineConfig config = EngineConfig{});

    /**
     * @brief Build an engine around an existing backend
     * @throws ConfigError on invalid configuration
     * @throws std::invalid_argument if backend is null
     */
    SandboxEngine(EngineConfig config,
                  std::unique_ptr<backends::ContainerBackend> backend,
                  LanguageRegistry registry = LanguageRegistry::Default());

    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Run one snippet
     * 
     * Runtime failures (image, container, timeout, program errors) come back
     * as a result; only pre-container failures throw.
     * 
     * @throws UnsupportedLanguageError if the language is not registered
     * @throws WorkspaceError if the files cannot be staged
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief Run a snippet with text on its standard input
     * @param limits Limits to use; the configured defaults when empty
     */
    ExecutionResult ExecuteWithInput(const std::string& code,
                                     const std::string& language,
                                     const std::string& stdin_input,
                                     const std::optional<ResourceLimits>& limits = std::nullopt);

    /**
     * @brief Run a snippet followed by its test code in one program
     * 
     * The program is `code + "\n\n" + test_code`; success means the tests
     * exited with code 0.
     */
    ExecutionResult ExecuteTests(const std::string& code,
                                 const std::string& test_code,
                                 const std::string& language,
                                 const std::optional<ResourceLimits>& limits = std::nullopt);

    /// All registered language identifiers with their runtimes
    std::vector<LanguageInfo> ListSupportedLanguages() const;

    /// Newest ledger entries, oldest first; 0 returns all retained
    std::vector<ExecutionLedgerEntry> RecentExecutions(std::size_t limit = 0) const;

    /**
     * @brief Remove leftover containers carrying the managed label
     * 
     * Containers of executions still running on this engine are kept, as
     * are containers whose owner process on this host is still alive.
     * 
     * @return Number of containers removed
     */
    std::size_t CleanupOrphans();

    std::string BackendName() const;

    /// Container runtime version, if the backend can report it
    std::optional<std::string> RuntimeVersion();

    const EngineConfig& config() const { return config_; }

private:
    void RecordExecution(const std::string& code, const ExecutionResult& result);

    static EngineConfig PrepareConfig(EngineConfig config);
    static std::unique_ptr<backends::ContainerBackend> SelectBackend(const EngineConfig& config);

    EngineConfig config_;
    LanguageRegistry registry_;
    std::unique_ptr<backends::ContainerBackend> backend_;
    ContainerLifecycleManager lifecycle_;
    ExecutionLedger ledger_;
};

} // namespace core
} // namespace runcage
