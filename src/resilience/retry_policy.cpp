#include "resilience/retry_policy.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace toolguard::resilience {

RetryPolicy::RetryPolicy(const int max_attempts,
                         const std::chrono::milliseconds initial_delay,
                         const double multiplier,
                         const std::optional<std::chrono::milliseconds> max_delay)
    : max_attempts_(max_attempts > 0 ? max_attempts : 1),
      initial_delay_(initial_delay),
      multiplier_(multiplier >= 1.0 ? multiplier : 1.0),
      max_delay_(max_delay) {}

int RetryPolicy::max_attempts(const tools::Tool& tool) const {
    return tool.annotations().can_retry() ? max_attempts_ : 1;
}

std::chrono::milliseconds RetryPolicy::next_delay(const int attempt_index) const {
    const int exponent = attempt_index > 1 ? attempt_index - 1 : 0;
    const double scaled = static_cast<double>(initial_delay_.count()) *
                          std::pow(multiplier_, exponent);

    // Saturate instead of overflowing for very long retry chains.
    constexpr double kLimit =
        static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2);
    std::chrono::milliseconds delay(
        static_cast<std::int64_t>(std::isfinite(scaled) && scaled < kLimit ? scaled : kLimit));

    if (max_delay_.has_value() && delay > *max_delay_) {
        delay = *max_delay_;
    }
    return delay;
}

bool RetryPolicy::is_retryable(const core::errors::Error&,
                               const core::context::Context& caller) const {
    return !caller.is_done();
}

}  // namespace toolguard::resilience
