#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace toolguard::protocol {

enum class RiskLevel {
    None,
    Low,
    Medium,
    High,
    Critical
};

inline std::string to_string(const RiskLevel level) {
    switch (level) {
        case RiskLevel::None:
            return "none";
        case RiskLevel::Low:
            return "low";
        case RiskLevel::Medium:
            return "medium";
        case RiskLevel::High:
            return "high";
        case RiskLevel::Critical:
            return "critical";
        default:
            return "unknown";
    }
}

// Behavioral hints a tool declares about itself.
struct Annotations {
    bool read_only = false;
    bool destructive = false;
    bool idempotent = false;
    bool cacheable = false;
    RiskLevel risk_level = RiskLevel::Low;
    bool requires_approval = false;

    // Only idempotent tools may be retried after an ambiguous failure.
    bool can_retry() const { return idempotent; }

    bool can_cache() const { return cacheable && (read_only || idempotent); }

    bool should_require_approval() const {
        return requires_approval || destructive || risk_level >= RiskLevel::High;
    }
};

inline Annotations default_annotations() {
    return Annotations{};
}

inline Annotations read_only_annotations() {
    Annotations annotations;
    annotations.read_only = true;
    annotations.idempotent = true;
    annotations.cacheable = true;
    annotations.risk_level = RiskLevel::None;
    return annotations;
}

inline Annotations destructive_annotations() {
    Annotations annotations;
    annotations.destructive = true;
    annotations.risk_level = RiskLevel::High;
    annotations.requires_approval = true;
    return annotations;
}

// What a tool hands back. The payload is opaque to the executor.
struct ToolResult {
    nlohmann::json output;
    std::chrono::nanoseconds duration{0};
    bool cached = false;
};

}  // namespace toolguard::protocol
