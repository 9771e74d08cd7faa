#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "core/errors/errors.hpp"

namespace toolguard::resilience {

//   Closed --(threshold consecutive failures)--> Open
//   Open --(cooldown elapsed, one probe admitted)--> HalfOpen
//   HalfOpen --(probe succeeds)--> Closed
//   HalfOpen --(probe fails)--> Open
enum class CircuitPhase {
    Closed,
    Open,
    HalfOpen
};

std::string to_string(CircuitPhase phase);

struct CircuitSnapshot {
    CircuitPhase phase = CircuitPhase::Closed;
    int consecutive_failures = 0;
    bool probe_in_flight = false;
    std::optional<std::chrono::steady_clock::time_point> opened_at;
};

// One breaker per tool name, created on first use and kept for the lifetime
// of the registry. Each breaker has its own lock so a failing tool never
// blocks unrelated ones.
class CircuitBreakerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    CircuitBreakerRegistry(int failure_threshold,
                           std::chrono::milliseconds open_timeout,
                           ClockFn clock = nullptr);

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // Empty when the call is admitted, circuit_open otherwise. Admitting a
    // caller after the cooldown makes it the single half-open probe.
    std::optional<core::errors::Error> check(const std::string& tool_name);

    void record_success(const std::string& tool_name);
    void record_failure(const std::string& tool_name);

    // Read-only views. Unknown tools report a fresh Closed breaker and are
    // not added to the registry.
    CircuitPhase phase(const std::string& tool_name) const;
    CircuitSnapshot snapshot(const std::string& tool_name) const;

    std::size_t size() const;

private:
    struct Breaker {
        std::mutex mutex;
        CircuitPhase phase = CircuitPhase::Closed;
        int consecutive_failures = 0;
        Clock::time_point opened_at{};
        bool probe_in_flight = false;
    };

    Breaker& breaker_for(const std::string& tool_name);
    Breaker* find_breaker(const std::string& tool_name) const;
    void open_locked(Breaker& breaker);

    const int failure_threshold_;
    const std::chrono::milliseconds open_timeout_;
    const ClockFn clock_;

    std::unordered_map<std::string, std::unique_ptr<Breaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;
};

}  // namespace toolguard::resilience
