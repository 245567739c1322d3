/**
 * @file resource_limits.hpp
 * @brief Per-request resource limits and the policy that clamps them
 * 
 * A LimitsRequest carries whatever the caller asked for. ResourceLimits is
 * the immutable, normalized form: constructing one always runs
 * NormalizeLimits(), so every ResourceLimits in existence satisfies
 * timeout_seconds() <= kMaxTimeoutSeconds.
 * 
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace runcage {
namespace core {

/// Hard ceiling on execution wall-clock time
constexpr int kMaxTimeoutSeconds = 30;

/**
 * @struct LimitsRequest
 * @brief Caller-requested limits, not yet normalized
 */
struct LimitsRequest {
    std::string memory_limit{"512m"};  ///< Docker byte-size string
    std::string memory_swap_limit;     ///< Empty = same as memory_limit
    std::int64_t cpu_quota{100000};    ///< CFS quota (100000/100000 = 1 CPU)
    std::int64_t cpu_period{100000};   ///< CFS period
    std::int64_t cpu_shares{1024};     ///< Relative CPU weight
    std::int64_t pids_limit{100};      ///< Maximum process count
    int timeout_seconds{30};           ///< Wall-clock timeout
};

/**
 * @brief Apply the limit policy
 * 
 * Pure and deterministic:
 * - timeout above kMaxTimeoutSeconds is clamped to it (warning logged)
 * - timeout below 1 second is raised to 1
 * - empty memory_swap_limit is set to memory_limit
 * - every other field passes through unchanged
 * 
 * @param requested Caller request
 * @return Normalized request
 */
LimitsRequest NormalizeLimits(const LimitsRequest& requested);

/**
 * @class ResourceLimits
 * @brief Immutable normalized resource limits
 * 
 * **Usage Example**:
 * @code
 * auto limits = ResourceLimits::Builder()
 *     .WithMemory("256m")
 *     .WithTimeout(std::chrono::seconds(60))   // clamped to 30
 *     .Build();
 * @endcode
 */
class ResourceLimits {
public:
    class Builder;

    /// Default limits: 512m, 1 CPU, 1024 shares, 100 pids, 30s
    ResourceLimits();

    /// Normalizes `requested` on construction
    explicit ResourceLimits(const LimitsRequest& requested);

    const std::string& memory_limit() const { return values_.memory_limit; }
    const std::string& memory_swap_limit() const { return values_.memory_swap_limit; }
    std::int64_t cpu_quota() const { return values_.cpu_quota; }
    std::int64_t cpu_period() const { return values_.cpu_period; }
    std::int64_t cpu_shares() const { return values_.cpu_shares; }
    std::int64_t pids_limit() const { return values_.pids_limit; }
    int timeout_seconds() const { return values_.timeout_seconds; }
    std::chrono::seconds timeout() const { return std::chrono::seconds(values_.timeout_seconds); }

    /// Normalized values as a plain request (for copying with changes)
    const LimitsRequest& values() const { return values_; }

private:
    LimitsRequest values_;
};

/**
 * @brief Re-apply the limit policy to already-constructed limits
 * 
 * Idempotent: a constructed ResourceLimits is already normalized.
 */
ResourceLimits NormalizeLimits(const ResourceLimits& limits);

/**
 * @class ResourceLimits::Builder
 * @brief Fluent construction of ResourceLimits
 */
class ResourceLimits::Builder {
public:
    Builder() = default;
    explicit Builder(const ResourceLimits& base) : request_(base.values()) {}

    /// Swap follows the new memory limit unless WithMemorySwap() was called
    Builder& WithMemory(const std::string& memory) {
        request_.memory_limit = memory;
        if (!swap_set_) {
            request_.memory_swap_limit.clear();
        }
        return *this;
    }

    Builder& WithMemorySwap(const std::string& memory_swap) {
        request_.memory_swap_limit = memory_swap;
        swap_set_ = true;
        return *this;
    }

    Builder& WithCpuQuota(std::int64_t quota) {
        request_.cpu_quota = quota;
        return *this;
    }

    Builder& WithCpuPeriod(std::int64_t period) {
        request_.cpu_period = period;
        return *this;
    }

    Builder& WithCpuShares(std::int64_t shares) {
        request_.cpu_shares = shares;
        return *this;
    }

    Builder& WithPidsLimit(std::int64_t pids) {
        request_.pids_limit = pids;
        return *this;
    }

    Builder& WithTimeoutSeconds(int seconds) {
        request_.timeout_seconds = seconds;
        return *this;
    }

    Builder& WithTimeout(std::chrono::seconds timeout) {
        request_.timeout_seconds = static_cast<int>(timeout.count());
        return *this;
    }

    ResourceLimits Build() const { return ResourceLimits(request_); }

private:
    LimitsRequest request_;
    bool swap_set_{false};
};

/**
 * @brief Parse a docker byte-size string
 * 
 * Accepts a non-negative integer with an optional b/k/m/g suffix
 * (case-insensitive), e.g. "512m", "1g", "1048576".
 * 
 * @param size Byte-size string
 * @return Size in bytes
 * 
 * @throws std::invalid_argument on malformed input or overflow
 */
std::int64_t ParseByteSize(const std::string& size);

} // namespace core
} // namespace runcage
