#pragma once

#include <chrono>
#include <optional>
#include "core/context/context.hpp"
#include "core/errors/errors.hpp"
#include "tools/tool.hpp"

namespace toolguard::resilience {

class RetryPolicy {
public:
    RetryPolicy(int max_attempts, std::chrono::milliseconds initial_delay,
                double multiplier = 2.0,
                std::optional<std::chrono::milliseconds> max_delay = std::nullopt);

    // Configured attempts for idempotent tools, 1 for everything else:
    // repeating a non-idempotent call after an ambiguous failure can
    // duplicate its side effects.
    int max_attempts(const tools::Tool& tool) const;

    // initial_delay * multiplier^(attempt_index - 1), capped by max_delay when
    // one is set. attempt_index is 1-based.
    std::chrono::milliseconds next_delay(int attempt_index) const;

    // Only the caller's state decides; the error itself is not inspected.
    // False once the caller's context has finished. Any failure with a live
    // caller, a per-attempt timeout included, stays retryable.
    bool is_retryable(const core::errors::Error&,
                      const core::context::Context& caller) const;

private:
    int max_attempts_;
    std::chrono::milliseconds initial_delay_;
    double multiplier_;
    std::optional<std::chrono::milliseconds> max_delay_;
};

}  // namespace toolguard::resilience
