#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/errors.hpp"

namespace toolguard::core::config {

struct ExecutorConfig {
    // Bulkhead capacity.
    int max_concurrent = 10;

    // Consecutive failures before a tool's breaker opens.
    int circuit_breaker_threshold = 5;

    // How long an open breaker rejects calls before admitting a probe.
    std::chrono::milliseconds circuit_breaker_timeout{30000};

    // Total attempts, first one included. Only idempotent tools get more than one.
    int retry_max_attempts = 3;

    std::chrono::milliseconds retry_initial_delay{100};
    double retry_backoff_multiplier = 2.0;

    // Unset means the backoff grows without a cap.
    std::optional<std::chrono::milliseconds> retry_max_delay;

    // Per-attempt deadline.
    std::chrono::milliseconds default_timeout{30000};
};

using Option = std::function<void(ExecutorConfig&)>;

ExecutorConfig default_executor_config();

Option with_max_concurrent(int max_concurrent);
Option with_circuit_breaker_threshold(int threshold);
Option with_circuit_breaker_timeout(std::chrono::milliseconds timeout);
Option with_retry_attempts(int attempts);
Option with_retry_delay(std::chrono::milliseconds delay);
Option with_backoff_multiplier(double multiplier);
Option with_max_retry_delay(std::chrono::milliseconds max_delay);
Option with_timeout(std::chrono::milliseconds timeout);

ExecutorConfig apply_options(ExecutorConfig base, const std::vector<Option>& options);

// Replaces every non-positive field with its default and logs what changed.
ExecutorConfig normalize_config(ExecutorConfig config);

// Strict variant of normalize_config: rejects instead of clamping.
core::errors::Result<ExecutorConfig> validate_config(const ExecutorConfig& config);

// Maps an already-parsed "resilience" section:
//   {"timeout_ms": 30000,
//    "retry": {"max_attempts", "initial_delay_ms", "max_delay_ms", "multiplier"},
//    "circuit_breaker": {"threshold", "timeout_ms"},
//    "bulkhead": {"max_concurrent"}}
// Absent keys keep their defaults.
core::errors::Result<ExecutorConfig> config_from_json(const nlohmann::json& section);

}  // namespace toolguard::core::config
