#pragma once

#include <chrono>
#include <cmath>
#include <random>
#include <cstdint>
#include <algorithm>

#include "tidewire/core/timestamp.hpp"


namespace tidewire::core::backoff {

// Retry delay policy
struct Policy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    int max_attempts{10};                       // 0 = unlimited
};

inline constexpr double MIN_JITTER = 0.5;
inline constexpr double MAX_JITTER = 1.0;

// -----------------------------------------------------------------------------
// delay(attempt) = min(max_delay, base_delay * 2^attempt) * jitter
//
// jitter is clamped to [MIN_JITTER, MAX_JITTER]. The exponent saturates, so
// large attempt counts simply yield max_delay * jitter.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline std::chrono::milliseconds compute_delay(const Policy& p, int attempt, double jitter) noexcept {
    attempt = std::clamp(attempt, 0, 62);
    jitter  = std::clamp(jitter, MIN_JITTER, MAX_JITTER);
    const double base   = static_cast<double>(p.base_delay.count());
    const double cap    = static_cast<double>(p.max_delay.count());
    const double scaled = std::min(cap, std::ldexp(base, attempt));
    return std::chrono::milliseconds(static_cast<std::int64_t>(scaled * jitter));
}

/*
===============================================================================
 backoff::Controller
===============================================================================

Tracks consecutive failed attempts for one subscription and turns them into
retry deadlines.

  - record_failure() counts one failed or interrupted attempt
  - exhausted() is true once max_attempts > 0 and attempts >= max_attempts
  - schedule(now) returns the next eligible retry time; the first retry after
    a reset waits base_delay * jitter
  - reset() is called on every successful transition into Active

Not thread-safe: owned and driven by the engine driver.
===============================================================================
*/
class Controller {
public:
    explicit Controller(Policy policy)
        : policy_(policy)
        , rng_(std::random_device{}())
        , jitter_(MIN_JITTER, MAX_JITTER)
    {}

    // Deterministic jitter sequence (tests)
    Controller(Policy policy, std::uint32_t seed)
        : policy_(policy)
        , rng_(seed)
        , jitter_(MIN_JITTER, MAX_JITTER)
    {}

    inline void record_failure() noexcept {
        ++attempts_;
    }

    inline void reset() noexcept {
        attempts_ = 0;
        next_retry_ = TimePoint{};
    }

    [[nodiscard]]
    inline bool exhausted() const noexcept {
        return policy_.max_attempts > 0 && attempts_ >= policy_.max_attempts;
    }

    // Arms the retry deadline for the current attempt count
    inline TimePoint schedule(TimePoint now) noexcept {
        last_delay_ = compute_delay(policy_, std::max(attempts_ - 1, 0), jitter_(rng_));
        next_retry_ = now + last_delay_;
        return next_retry_;
    }

    [[nodiscard]]
    inline bool ready(TimePoint now) const noexcept {
        return now >= next_retry_;
    }

    // Accessors
    [[nodiscard]] inline int attempts() const noexcept { return attempts_; }
    [[nodiscard]] inline TimePoint next_retry() const noexcept { return next_retry_; }
    [[nodiscard]] inline std::chrono::milliseconds last_delay() const noexcept { return last_delay_; }
    [[nodiscard]] inline const Policy& policy() const noexcept { return policy_; }

private:
    Policy policy_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> jitter_;
    int attempts_{0};
    TimePoint next_retry_{};
    std::chrono::milliseconds last_delay_{0};
};

} // namespace tidewire::core::backoff
