#include "resilience/circuit_breaker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolguard::resilience {

std::string to_string(const CircuitPhase phase) {
    switch (phase) {
        case CircuitPhase::Closed:
            return "closed";
        case CircuitPhase::Open:
            return "open";
        case CircuitPhase::HalfOpen:
            return "half_open";
        default:
            return "unknown";
    }
}

CircuitBreakerRegistry::CircuitBreakerRegistry(const int failure_threshold,
                                               const std::chrono::milliseconds open_timeout,
                                               ClockFn clock)
    : failure_threshold_(failure_threshold > 0 ? failure_threshold : 1),
      open_timeout_(open_timeout),
      clock_(clock ? std::move(clock) : ClockFn([]() { return Clock::now(); })) {}

CircuitBreakerRegistry::Breaker& CircuitBreakerRegistry::breaker_for(
    const std::string& tool_name) {
    {
        std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
        const auto it = breakers_.find(tool_name);
        if (it != breakers_.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(tool_name, nullptr);
    if (inserted) {
        it->second = std::make_unique<Breaker>();
    }
    return *it->second;
}

CircuitBreakerRegistry::Breaker* CircuitBreakerRegistry::find_breaker(
    const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    const auto it = breakers_.find(tool_name);
    return it == breakers_.end() ? nullptr : it->second.get();
}

void CircuitBreakerRegistry::open_locked(Breaker& breaker) {
    breaker.phase = CircuitPhase::Open;
    breaker.opened_at = clock_();
    breaker.probe_in_flight = false;
}

std::optional<core::errors::Error> CircuitBreakerRegistry::check(
    const std::string& tool_name) {
    Breaker& breaker = breaker_for(tool_name);
    bool became_half_open = false;
    {
        std::lock_guard<std::mutex> lock(breaker.mutex);
        switch (breaker.phase) {
            case CircuitPhase::Closed:
                return std::nullopt;
            case CircuitPhase::Open:
                if (clock_() - breaker.opened_at < open_timeout_) {
                    return core::errors::circuit_open_error(tool_name);
                }
                breaker.phase = CircuitPhase::HalfOpen;
                breaker.consecutive_failures = 0;
                breaker.probe_in_flight = true;
                became_half_open = true;
                break;
            case CircuitPhase::HalfOpen:
                if (breaker.probe_in_flight) {
                    return core::errors::circuit_open_error(tool_name);
                }
                breaker.probe_in_flight = true;
                break;
        }
    }

    if (became_half_open) {
        TOOLGUARD_LOG_INFO("CircuitBreaker: " + tool_name +
                           " transition open -> half_open, admitting probe");
    }
    return std::nullopt;
}

void CircuitBreakerRegistry::record_success(const std::string& tool_name) {
    Breaker& breaker = breaker_for(tool_name);
    CircuitPhase previous;
    {
        std::lock_guard<std::mutex> lock(breaker.mutex);
        previous = breaker.phase;
        breaker.phase = CircuitPhase::Closed;
        breaker.consecutive_failures = 0;
        breaker.probe_in_flight = false;
    }

    if (previous != CircuitPhase::Closed) {
        TOOLGUARD_LOG_INFO("CircuitBreaker: " + tool_name + " transition " +
                           to_string(previous) + " -> closed");
    }
}

void CircuitBreakerRegistry::record_failure(const std::string& tool_name) {
    Breaker& breaker = breaker_for(tool_name);
    CircuitPhase previous;
    bool opened = false;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(breaker.mutex);
        previous = breaker.phase;
        if (breaker.phase == CircuitPhase::HalfOpen) {
            open_locked(breaker);
            opened = true;
        } else if (breaker.phase == CircuitPhase::Closed) {
            ++breaker.consecutive_failures;
            if (breaker.consecutive_failures >= failure_threshold_) {
                open_locked(breaker);
                opened = true;
            }
        }
        // Failures reported while already Open come from calls admitted
        // earlier; they do not restart the cooldown.
        failures = breaker.consecutive_failures;
    }

    if (!opened) {
        return;
    }
    if (previous == CircuitPhase::HalfOpen) {
        TOOLGUARD_LOG_WARN("CircuitBreaker: " + tool_name +
                           " transition half_open -> open, probe failed");
    } else {
        TOOLGUARD_LOG_WARN("CircuitBreaker: " + tool_name +
                           " transition closed -> open after " +
                           std::to_string(failures) + " consecutive failure(s)");
    }
}

CircuitPhase CircuitBreakerRegistry::phase(const std::string& tool_name) const {
    return snapshot(tool_name).phase;
}

CircuitSnapshot CircuitBreakerRegistry::snapshot(const std::string& tool_name) const {
    CircuitSnapshot view;
    Breaker* breaker = find_breaker(tool_name);
    if (breaker == nullptr) {
        return view;
    }

    std::lock_guard<std::mutex> lock(breaker->mutex);
    view.phase = breaker->phase;
    view.consecutive_failures = breaker->consecutive_failures;
    view.probe_in_flight = breaker->probe_in_flight;
    if (breaker->phase != CircuitPhase::Closed) {
        view.opened_at = breaker->opened_at;
    }
    return view;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    return breakers_.size();
}

}  // namespace toolguard::resilience
