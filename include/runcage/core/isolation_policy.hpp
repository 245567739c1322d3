/**
 * @file isolation_policy.hpp
 * @brief Security and resource parameters every sandbox container gets
 * 
 * DeriveIsolation() is pure: the same request and limits always produce the
 * same IsolationSpec. Capability dropping, no-new-privileges and the noexec
 * tmpfs are unconditional; only network and root-filesystem writability
 * follow the request.
 * 
 * @date 2025
 */

#pragma once

#include "runcage/core/execution_types.hpp"
#include "runcage/core/resource_limits.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace runcage {
namespace core {

/**
 * @struct IsolationDefaults
 * @brief Engine-wide isolation settings (from EngineConfig)
 */
struct IsolationDefaults {
    std::string tmpfs_size{"100m"};  ///< Size of the /tmp tmpfs
    std::string tmpfs_path{"/tmp"};  ///< Mount point of the tmpfs
};

/**
 * @struct IsolationSpec
 * @brief Complete isolation parameters of one container
 */
struct IsolationSpec {
    // Network / filesystem
    std::string network_mode{"none"};             ///< "none" or "bridge"
    bool read_only_rootfs{true};                  ///< --read-only
    std::vector<std::string> cap_drop{"ALL"};     ///< Dropped capabilities
    std::vector<std::string> security_opt{"no-new-privileges"};  ///< Security options
    std::string tmpfs_path{"/tmp"};               ///< tmpfs mount point
    std::string tmpfs_options;                    ///< "size=100m,noexec,nosuid,nodev"
    bool init_process{true};                      ///< --init; PID 1 forwards SIGTERM to the program

    // Resources
    std::string memory;                           ///< Memory limit string
    std::string memory_swap;                      ///< Memory+swap limit string
    std::optional<std::int64_t> memory_bytes;     ///< Parsed memory; empty if malformed
    std::optional<std::int64_t> memory_swap_bytes;///< Parsed swap; empty if malformed
    std::int64_t cpu_quota{0};
    std::int64_t cpu_period{0};
    std::int64_t cpu_shares{0};
    std::int64_t pids_limit{0};

    /// One-line summary for debug logs
    std::string Describe() const;
};

/**
 * @brief Derive isolation parameters for a request
 * @param request Execution request (network and read-only flags)
 * @param limits Normalized resource limits
 * @param defaults Engine-wide tmpfs settings
 * @return IsolationSpec
 */
IsolationSpec DeriveIsolation(const ExecutionRequest& request,
                              const ResourceLimits& limits,
                              const IsolationDefaults& defaults = IsolationDefaults{});

} // namespace core
} // namespace runcage
