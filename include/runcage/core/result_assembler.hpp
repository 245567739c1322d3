/**
 * @file result_assembler.hpp
 * @brief Raw container outcome → caller-facing ExecutionResult
 * 
 * @date 2025
 */

#pragma once

#include "runcage/core/execution_types.hpp"

#include <chrono>
#include <string>

namespace runcage {
namespace core {

/**
 * @brief Build the final result of an execution
 * 
 * - success = exit code 0, no infra error, not timed out
 * - timed out outcomes get exit code 124 and a timeout message
 * - infra errors get exit code -1 and keep their message
 * - stdout/stderr are UTF-8 sanitized
 * - execution time is rounded to milliseconds
 * 
 * @param raw Outcome from the lifecycle manager
 * @param language_id Requested language id, trimmed and lowercased
 * @param display_name Runtime display name
 * @param elapsed Engine-measured wall clock time
 * @return ExecutionResult stamped with the current time
 */
ExecutionResult AssembleResult(const ExecutionOutcome& raw,
                               const std::string& language_id,
                               const std::string& display_name,
                               std::chrono::steady_clock::duration elapsed);

/// Round a duration to seconds with millisecond precision
double RoundedSeconds(std::chrono::steady_clock::duration elapsed);

} // namespace core
} // namespace runcage
