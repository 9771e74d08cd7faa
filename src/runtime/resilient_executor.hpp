#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/executor_config.hpp"
#include "core/context/context.hpp"
#include "core/errors/errors.hpp"
#include "resilience/bulkhead.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/retry_policy.hpp"
#include "resilience/timeout_guard.hpp"
#include "tools/tool.hpp"

namespace toolguard::runtime {

struct ExecutionResult {
    nlohmann::json output;
    // Wall-clock time spent inside tool attempts, summed; backoff excluded.
    std::chrono::nanoseconds duration{0};
    int attempts = 0;
};

// Runs tools behind a bulkhead, a per-tool circuit breaker, a per-attempt
// timeout and, for idempotent tools, exponential-backoff retries.
//
// Safe to share between threads. Callers always get either one successful
// result or one terminal error.
class ResilientExecutor {
public:
    ResilientExecutor();
    explicit ResilientExecutor(core::config::ExecutorConfig config);

    ResilientExecutor(const ResilientExecutor&) = delete;
    ResilientExecutor& operator=(const ResilientExecutor&) = delete;

    core::errors::Result<ExecutionResult> execute(
        const std::shared_ptr<core::context::Context>& ctx, tools::Tool& tool,
        const nlohmann::json& input);

    // execute() under an extra call-level deadline.
    core::errors::Result<ExecutionResult> execute_with_timeout(
        const std::shared_ptr<core::context::Context>& ctx, tools::Tool& tool,
        const nlohmann::json& input, std::chrono::milliseconds timeout);

    // One direct call: no bulkhead, breaker, retry or timeout.
    core::errors::Result<ExecutionResult> execute_simple(
        const std::shared_ptr<core::context::Context>& ctx, tools::Tool& tool,
        const nlohmann::json& input) const;

    resilience::CircuitPhase circuit_phase(const std::string& tool_name) const;
    resilience::CircuitSnapshot circuit_snapshot(const std::string& tool_name) const;

    const core::config::ExecutorConfig& config() const;

    // No-op. Breakers recover only through the cooldown and a half-open probe;
    // there is no way to force one closed.
    void reset();

private:
    core::errors::Result<protocol::ToolResult> run_attempt(
        tools::Tool& tool, const core::context::Context& attempt_ctx,
        const nlohmann::json& input) const;

    core::config::ExecutorConfig config_;
    resilience::Bulkhead bulkhead_;
    resilience::CircuitBreakerRegistry breakers_;
    resilience::RetryPolicy retry_policy_;
    resilience::TimeoutGuard timeout_guard_;
};

// Defaults, then each option in order.
std::unique_ptr<ResilientExecutor> make_executor(
    const std::vector<core::config::Option>& options = {});

}  // namespace toolguard::runtime
