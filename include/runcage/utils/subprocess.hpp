/**
 * @file subprocess.hpp
 * @brief Shell-free child process execution with deadline enforcement
 *
 * Runs an argv vector with fork/execvp, captures stdout and stderr on separate
 * pipes, and kills the whole child process group when the deadline passes.
 * Used by the docker CLI backend and for runtime probing.
 *
 * @date 2025
 */

#pragma once

#include "runcage/core/deadline.hpp"

#include <string>
#include <vector>

namespace runcage {
namespace utils {

/**
 * @struct SubprocessOptions
 * @brief Execution options for RunSubprocess()
 */
struct SubprocessOptions {
    core::Deadline deadline{core::Deadline::Never()};  ///< Kill child when reached
    std::size_t max_output_bytes{16 * 1024 * 1024};    ///< Per-stream capture cap
};

/**
 * @struct SubprocessResult
 * @brief Outcome of a child process
 */
struct SubprocessResult {
    int exit_code{-1};          ///< Exit status; 128+N when killed by signal N
    std::string stdout_output;  ///< Captured stdout (possibly truncated)
    std::string stderr_output;  ///< Captured stderr (possibly truncated)
    bool timed_out{false};      ///< Deadline reached, child killed
    bool spawn_failed{false};   ///< fork/exec failed, child never ran
    std::string error;          ///< Description when spawn_failed

    bool success() const { return !spawn_failed && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command without a shell
 *
 * The child gets /dev/null as stdin and runs in its own process group so that
 * a deadline kill also reaches its descendants. Output already captured at
 * kill time is kept.
 *
 * @param argv Program and arguments; argv[0] is looked up on PATH
 * @param options Deadline and capture limits
 * @return SubprocessResult, never throws for child failures
 *
 * @throws std::invalid_argument if argv is empty
 */
SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const SubprocessOptions& options = SubprocessOptions{});

} // namespace utils
} // namespace runcage
