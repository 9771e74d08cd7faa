#include "core/config/executor_config.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include "core/logging/logger.hpp"

namespace toolguard::core::config {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

Error invalid_config(const std::string& message) {
    return Error{ErrorCategory::Input, message, core::errors::codes::kInvalidConfig,
                 "All counts and durations must be positive."};
}

void clamp_count(int& value, const int fallback, const char* field) {
    if (value > 0) {
        return;
    }
    TOOLGUARD_LOG_WARN(std::string("ExecutorConfig: ") + field + "=" +
                       std::to_string(value) + " is not positive, using " +
                       std::to_string(fallback));
    value = fallback;
}

void clamp_duration(std::chrono::milliseconds& value,
                    const std::chrono::milliseconds fallback, const char* field) {
    if (value.count() > 0) {
        return;
    }
    TOOLGUARD_LOG_WARN(std::string("ExecutorConfig: ") + field + "=" +
                       std::to_string(value.count()) + "ms is not positive, using " +
                       std::to_string(fallback.count()) + "ms");
    value = fallback;
}

// Reads section[key] into out when present. Returns false on a type mismatch
// or a value that does not fit the target type.
bool read_int(const json& section, const char* key, int& out) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section.at(key);
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(raw);
        return true;
    }
    if (!value.is_number_integer()) {
        return false;
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(raw);
    return true;
}

bool read_millis(const json& section, const char* key,
                 std::chrono::milliseconds& out) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section.at(key);
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return false;
    }
    out = std::chrono::milliseconds(value.get<std::int64_t>());
    return true;
}

std::optional<Error> nested_section(const json& parent, const char* key, json& out) {
    out = json::object();
    if (!parent.contains(key)) {
        return std::nullopt;
    }
    const auto& value = parent.at(key);
    if (!value.is_object()) {
        return invalid_config(std::string("\"") + key + "\" must be an object.");
    }
    out = value;
    return std::nullopt;
}

}  // namespace

ExecutorConfig default_executor_config() {
    return ExecutorConfig{};
}

Option with_max_concurrent(const int max_concurrent) {
    return [max_concurrent](ExecutorConfig& config) {
        config.max_concurrent = max_concurrent;
    };
}

Option with_circuit_breaker_threshold(const int threshold) {
    return [threshold](ExecutorConfig& config) {
        config.circuit_breaker_threshold = threshold;
    };
}

Option with_circuit_breaker_timeout(const std::chrono::milliseconds timeout) {
    return [timeout](ExecutorConfig& config) {
        config.circuit_breaker_timeout = timeout;
    };
}

Option with_retry_attempts(const int attempts) {
    return [attempts](ExecutorConfig& config) {
        config.retry_max_attempts = attempts;
    };
}

Option with_retry_delay(const std::chrono::milliseconds delay) {
    return [delay](ExecutorConfig& config) { config.retry_initial_delay = delay; };
}

Option with_backoff_multiplier(const double multiplier) {
    return [multiplier](ExecutorConfig& config) {
        config.retry_backoff_multiplier = multiplier;
    };
}

Option with_max_retry_delay(const std::chrono::milliseconds max_delay) {
    return [max_delay](ExecutorConfig& config) { config.retry_max_delay = max_delay; };
}

Option with_timeout(const std::chrono::milliseconds timeout) {
    return [timeout](ExecutorConfig& config) { config.default_timeout = timeout; };
}

ExecutorConfig apply_options(ExecutorConfig base, const std::vector<Option>& options) {
    for (const auto& option : options) {
        if (option) {
            option(base);
        }
    }
    return base;
}

ExecutorConfig normalize_config(ExecutorConfig config) {
    const ExecutorConfig defaults;
    clamp_count(config.max_concurrent, defaults.max_concurrent, "max_concurrent");
    clamp_count(config.circuit_breaker_threshold, defaults.circuit_breaker_threshold,
                "circuit_breaker_threshold");
    clamp_count(config.retry_max_attempts, defaults.retry_max_attempts,
                "retry_max_attempts");
    clamp_duration(config.circuit_breaker_timeout, defaults.circuit_breaker_timeout,
                   "circuit_breaker_timeout");
    clamp_duration(config.retry_initial_delay, defaults.retry_initial_delay,
                   "retry_initial_delay");
    clamp_duration(config.default_timeout, defaults.default_timeout,
                   "default_timeout");

    if (!(config.retry_backoff_multiplier >= 1.0)) {
        TOOLGUARD_LOG_WARN("ExecutorConfig: retry_backoff_multiplier=" +
                           std::to_string(config.retry_backoff_multiplier) +
                           " is below 1, using 1");
        config.retry_backoff_multiplier = 1.0;
    }
    if (config.retry_max_delay.has_value() && config.retry_max_delay->count() <= 0) {
        TOOLGUARD_LOG_WARN("ExecutorConfig: retry_max_delay is not positive, removing the cap");
        config.retry_max_delay.reset();
    }
    return config;
}

core::errors::Result<ExecutorConfig> validate_config(const ExecutorConfig& config) {
    if (config.max_concurrent <= 0) {
        return invalid_config("max_concurrent must be at least 1.");
    }
    if (config.circuit_breaker_threshold <= 0) {
        return invalid_config("circuit_breaker_threshold must be at least 1.");
    }
    if (config.retry_max_attempts <= 0) {
        return invalid_config("retry_max_attempts must be at least 1.");
    }
    if (config.circuit_breaker_timeout.count() <= 0) {
        return invalid_config("circuit_breaker_timeout must be positive.");
    }
    if (config.retry_initial_delay.count() <= 0) {
        return invalid_config("retry_initial_delay must be positive.");
    }
    if (config.default_timeout.count() <= 0) {
        return invalid_config("default_timeout must be positive.");
    }
    if (!(config.retry_backoff_multiplier >= 1.0)) {
        return invalid_config("retry_backoff_multiplier must be at least 1.");
    }
    if (config.retry_max_delay.has_value() && config.retry_max_delay->count() <= 0) {
        return invalid_config("retry_max_delay must be positive when set.");
    }
    return config;
}

core::errors::Result<ExecutorConfig> config_from_json(const json& section) {
    if (!section.is_object()) {
        return invalid_config("Resilience section must be a JSON object.");
    }

    ExecutorConfig config = default_executor_config();
    if (!read_millis(section, "timeout_ms", config.default_timeout)) {
        return invalid_config("\"timeout_ms\" must be an integer in range.");
    }

    json retry_section;
    if (auto err = nested_section(section, "retry", retry_section)) {
        return *err;
    }
    if (!read_int(retry_section, "max_attempts", config.retry_max_attempts)) {
        return invalid_config("\"retry.max_attempts\" must be an integer in range.");
    }
    if (!read_millis(retry_section, "initial_delay_ms", config.retry_initial_delay)) {
        return invalid_config("\"retry.initial_delay_ms\" must be an integer in range.");
    }
    if (retry_section.contains("max_delay_ms")) {
        std::chrono::milliseconds max_delay{0};
        if (!read_millis(retry_section, "max_delay_ms", max_delay)) {
            return invalid_config("\"retry.max_delay_ms\" must be an integer in range.");
        }
        config.retry_max_delay = max_delay;
    }
    if (retry_section.contains("multiplier")) {
        const auto& multiplier = retry_section.at("multiplier");
        if (!multiplier.is_number()) {
            return invalid_config("\"retry.multiplier\" must be a number.");
        }
        config.retry_backoff_multiplier = multiplier.get<double>();
    }

    json breaker_section;
    if (auto err = nested_section(section, "circuit_breaker", breaker_section)) {
        return *err;
    }
    if (!read_int(breaker_section, "threshold", config.circuit_breaker_threshold)) {
        return invalid_config("\"circuit_breaker.threshold\" must be an integer in range.");
    }
    if (!read_millis(breaker_section, "timeout_ms", config.circuit_breaker_timeout)) {
        return invalid_config("\"circuit_breaker.timeout_ms\" must be an integer in range.");
    }

    json bulkhead_section;
    if (auto err = nested_section(section, "bulkhead", bulkhead_section)) {
        return *err;
    }
    if (!read_int(bulkhead_section, "max_concurrent", config.max_concurrent)) {
        return invalid_config("\"bulkhead.max_concurrent\" must be an integer in range.");
    }

    return validate_config(config);
}

}  // namespace toolguard::core::config
