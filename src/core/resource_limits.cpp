/**
 * @file resource_limits.cpp
 * @brief Resource limit policy
 * 
 * @date 2025
 */

#include "runcage/core/resource_limits.hpp"
#include "runcage/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <limits>
#include <stdexcept>

namespace runcage {
namespace core {

LimitsRequest NormalizeLimits(const LimitsRequest& requested) {
    LimitsRequest normalized = requested;

    if (normalized.timeout_seconds > kMaxTimeoutSeconds) {
        spdlog::warn("Timeout {}s exceeds max {}s, using {}s",
                     normalized.timeout_seconds, kMaxTimeoutSeconds, kMaxTimeoutSeconds);
        normalized.timeout_seconds = kMaxTimeoutSeconds;
    } else if (normalized.timeout_seconds < 1) {
        spdlog::warn("Timeout {}s is not positive, using 1s", normalized.timeout_seconds);
        normalized.timeout_seconds = 1;
    }

    if (normalized.memory_swap_limit.empty()) {
        normalized.memory_swap_limit = normalized.memory_limit;
    }

    return normalized;
}

ResourceLimits::ResourceLimits()
    : ResourceLimits(LimitsRequest{}) {
}

ResourceLimits::ResourceLimits(const LimitsRequest& requested)
    : values_(NormalizeLimits(requested)) {
}

ResourceLimits NormalizeLimits(const ResourceLimits& limits) {
    return ResourceLimits(limits.values());
}

std::int64_t ParseByteSize(const std::string& size) {
    std::string value = utils::StringUtils::ToLower(utils::StringUtils::Trim(size));
    if (value.empty()) {
        throw std::invalid_argument("Empty byte size");
    }

    std::int64_t multiplier = 1;
    switch (value.back()) {
        case 'b': multiplier = 1; value.pop_back(); break;
        case 'k': multiplier = 1024LL; value.pop_back(); break;
        case 'm': multiplier = 1024LL * 1024; value.pop_back(); break;
        case 'g': multiplier = 1024LL * 1024 * 1024; value.pop_back(); break;
        default: break;
    }

    if (value.empty()) {
        throw std::invalid_argument("Byte size without digits: '" + size + "'");
    }

    std::int64_t number = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Malformed byte size: '" + size + "'");
        }
        int digit = c - '0';
        if (number > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
            throw std::invalid_argument("Byte size overflows: '" + size + "'");
        }
        number = number * 10 + digit;
    }

    if (number > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw std::invalid_argument("Byte size overflows: '" + size + "'");
    }
    return number * multiplier;
}

} // namespace core
} // namespace runcage
