/**
 * @file deadline.hpp
 * @brief Per-request monotonic deadline
 * 
 * Every blocking backend call receives a Deadline instead of a bare timeout,
 * so that a single request-scoped bound flows from the engine down to the
 * transport (curl timeout, subprocess kill). This is also the hook for a
 * future explicit cancellation API.
 * 
 * @date 2025
 */

#pragma once

#include <algorithm>
#include <chrono>

namespace runcage {
namespace core {

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// Deadline that expires `duration` from now
    static Deadline After(Clock::duration duration) {
        return Deadline(Clock::now() + duration, false);
    }

    /// Deadline that never expires
    static Deadline Never() {
        return Deadline(Clock::time_point::max(), true);
    }

    bool IsInfinite() const { return infinite_; }

    bool Expired() const {
        return !infinite_ && Clock::now() >= when_;
    }

    /// Time left, clamped at zero; Clock::duration::max() when infinite
    Clock::duration Remaining() const {
        if (infinite_) {
            return Clock::duration::max();
        }
        return std::max(when_ - Clock::now(), Clock::duration::zero());
    }

    std::chrono::milliseconds RemainingMillis() const {
        if (infinite_) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(Remaining());
    }

    /// Same deadline pushed back by `margin`
    Deadline Extended(Clock::duration margin) const {
        if (infinite_) {
            return *this;
        }
        return Deadline(when_ + margin, false);
    }

private:
    Deadline(Clock::time_point when, bool infinite)
        : when_(when), infinite_(infinite) {}

    Clock::time_point when_;
    bool infinite_;
};

} // namespace core
} // namespace runcage
