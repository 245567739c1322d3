/**
 * @file result_assembler.cpp
 * @brief Execution result assembly
 * 
 * @date 2025
 */

#include "runcage/core/result_assembler.hpp"
#include "runcage/utils/string_utils.hpp"

#include <cmath>

namespace runcage {
namespace core {

double RoundedSeconds(std::chrono::steady_clock::duration elapsed) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    return std::round(static_cast<double>(micros) / 1000.0) / 1000.0;
}

ExecutionResult AssembleResult(const ExecutionOutcome& raw,
                               const std::string& language_id,
                               const std::string& display_name,
                               std::chrono::steady_clock::duration elapsed) {
    ExecutionResult result;

    result.stdout_output = utils::StringUtils::SanitizeUtf8(raw.stdout_bytes);
    result.stderr_output = utils::StringUtils::SanitizeUtf8(raw.stderr_bytes);
    result.execution_time_seconds = RoundedSeconds(elapsed);
    result.container_id = raw.container_id;
    result.language = language_id + " (" + display_name + ")";
    result.timestamp = std::chrono::system_clock::now();

    if (raw.timed_out) {
        result.timed_out = true;
        result.exit_code = kTimeoutExitCode;
        result.success = false;
        result.error_message = "Execution timed out after " + std::to_string(raw.timeout_seconds) + "s";
    } else if (raw.infra_error) {
        result.exit_code = kInfraErrorExitCode;
        result.success = false;
        result.error_message = raw.infra_error;
    } else {
        result.exit_code = raw.exit_code;
        result.success = (raw.exit_code == 0);
    }

    return result;
}

} // namespace core
} // namespace runcage
