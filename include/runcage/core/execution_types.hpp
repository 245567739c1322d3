/**
 * @file execution_types.hpp
 * @brief Request, raw outcome and final result of one sandboxed execution
 * 
 * @date 2025
 */

#pragma once

#include "runcage/core/resource_limits.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace runcage {
namespace core {

/// Exit code reported for executions killed at their deadline
constexpr int kTimeoutExitCode = 124;

/// Exit code reported when the program never produced an exit status
constexpr int kInfraErrorExitCode = -1;

/**
 * @struct ExecutionRequest
 * @brief One request to run a code snippet
 */
struct ExecutionRequest {
    std::string code;                                     ///< Source text
    std::string language;                                 ///< Language identifier
    ResourceLimits limits;                                ///< Normalized on construction
    bool network_enabled{false};                          ///< Attach to bridge network
    bool read_only{true};                                 ///< Read-only root filesystem
    std::map<std::string, std::string> env_vars;          ///< Extra environment
    std::map<std::string, std::string> auxiliary_files;   ///< Relative path → content
    std::optional<std::string> stdin_input;               ///< Text fed on standard input
};

/**
 * @struct ExecutionOutcome
 * @brief Raw outcome produced by the container lifecycle
 * 
 * `infra_error` is set when the program never ran to an exit status for a
 * reason other than its deadline (image, create, start, wait failures).
 */
struct ExecutionOutcome {
    int exit_code{kInfraErrorExitCode};       ///< Program exit code
    std::string stdout_bytes;                 ///< Raw stdout
    std::string stderr_bytes;                 ///< Raw stderr
    bool timed_out{false};                    ///< Killed at the deadline
    std::optional<std::string> infra_error;   ///< Prefixed with the error taxonomy name
    std::optional<std::string> container_id;  ///< Container that ran, if one was created
    int timeout_seconds{0};                   ///< Deadline the run was held to
};

/**
 * @struct ExecutionResult
 * @brief Final, caller-facing result
 */
struct ExecutionResult {
    bool success{false};                        ///< exit 0, no timeout, no infra error
    int exit_code{kInfraErrorExitCode};         ///< 124 = timeout, -1 = infra error
    std::string stdout_output;                  ///< UTF-8 sanitized stdout
    std::string stderr_output;                  ///< UTF-8 sanitized stderr
    double execution_time_seconds{0.0};         ///< Wall clock, millisecond precision
    bool timed_out{false};                      ///< Killed at the deadline
    std::optional<std::string> error_message;   ///< Infra or timeout description
    std::optional<std::string> container_id;    ///< Container id, if one was created
    std::string language;                       ///< "<requested id> (<display name>)"
    std::chrono::system_clock::time_point timestamp;  ///< Completion time
};

/// ISO-8601 UTC timestamp with millisecond precision
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

nlohmann::json ToJson(const ExecutionResult& result);

} // namespace core
} // namespace runcage
