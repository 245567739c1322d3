/**
 * @file isolation_policy.cpp
 * @brief Isolation parameter derivation
 * 
 * @date 2025
 */

#include "runcage/core/isolation_policy.hpp"
#include "runcage/utils/string_utils.hpp"

#include <sstream>
#include <stdexcept>

namespace runcage {
namespace core {

namespace {

std::optional<std::int64_t> TryParseByteSize(const std::string& size) {
    try {
        return ParseByteSize(size);
    } catch (const std::invalid_argument&) {
        // Left to the runtime to reject at creation time
        return std::nullopt;
    }
}

} // anonymous namespace

IsolationSpec DeriveIsolation(const ExecutionRequest& request,
                              const ResourceLimits& limits,
                              const IsolationDefaults& defaults) {
    IsolationSpec spec;

    spec.network_mode = request.network_enabled ? "bridge" : "none";
    spec.read_only_rootfs = request.read_only;
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges"};
    spec.tmpfs_path = defaults.tmpfs_path;
    spec.tmpfs_options = "size=" + defaults.tmpfs_size + ",noexec,nosuid,nodev";

    spec.memory = limits.memory_limit();
    spec.memory_swap = limits.memory_swap_limit();
    spec.memory_bytes = TryParseByteSize(spec.memory);
    spec.memory_swap_bytes = TryParseByteSize(spec.memory_swap);
    spec.cpu_quota = limits.cpu_quota();
    spec.cpu_period = limits.cpu_period();
    spec.cpu_shares = limits.cpu_shares();
    spec.pids_limit = limits.pids_limit();

    return spec;
}

std::string IsolationSpec::Describe() const {
    std::ostringstream oss;
    oss << "network=" << network_mode
        << " read_only=" << (read_only_rootfs ? "true" : "false")
        << " cap_drop=" << utils::StringUtils::Join(cap_drop, ",")
        << " security_opt=" << utils::StringUtils::Join(security_opt, ",")
        << " tmpfs=" << tmpfs_path << ":" << tmpfs_options
        << " init=" << (init_process ? "true" : "false")
        << " memory=" << memory << " swap=" << memory_swap
        << " cpu=" << cpu_quota << "/" << cpu_period
        << " shares=" << cpu_shares
        << " pids=" << pids_limit;
    return oss.str();
}

} // namespace core
} // namespace runcage
