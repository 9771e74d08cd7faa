#include "runtime/resilient_executor.hpp"

#include <exception>
#include <utility>
#include "core/config/call_id.hpp"
#include "core/logging/logger.hpp"

namespace toolguard::runtime {

using core::context::Context;
using core::errors::Error;
using core::errors::ErrorCategory;
using protocol::ToolResult;

namespace {

using Clock = std::chrono::steady_clock;

std::string millis_text(const std::chrono::nanoseconds duration) {
    return std::to_string(
               std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()) +
           "ms";
}

}  // namespace

ResilientExecutor::ResilientExecutor()
    : ResilientExecutor(core::config::default_executor_config()) {}

ResilientExecutor::ResilientExecutor(core::config::ExecutorConfig config)
    : config_(core::config::normalize_config(std::move(config))),
      bulkhead_(config_.max_concurrent),
      breakers_(config_.circuit_breaker_threshold, config_.circuit_breaker_timeout),
      retry_policy_(config_.retry_max_attempts, config_.retry_initial_delay,
                    config_.retry_backoff_multiplier, config_.retry_max_delay),
      timeout_guard_(config_.default_timeout) {}

core::errors::Result<ToolResult> ResilientExecutor::run_attempt(
    tools::Tool& tool, const Context& attempt_ctx, const nlohmann::json& input) const {
    try {
        return tool.execute(attempt_ctx, input);
    } catch (const std::exception& ex) {
        return Error{ErrorCategory::Execution,
                     "Tool threw an exception: " + std::string(ex.what()),
                     core::errors::codes::kToolFailed};
    } catch (...) {
        // Still counts as a failed attempt so a half-open probe is settled.
        return Error{ErrorCategory::Execution, "Tool threw a non-standard exception.",
                     core::errors::codes::kToolFailed};
    }
}

core::errors::Result<ExecutionResult> ResilientExecutor::execute(
    const std::shared_ptr<Context>& ctx, tools::Tool& tool,
    const nlohmann::json& input) {
    const std::shared_ptr<Context> caller = ctx ? ctx : Context::background();
    const std::string tool_name = tool.name();
    const std::string call_id = core::config::generate_call_id();

    if (auto admission = bulkhead_.acquire(*caller)) {
        TOOLGUARD_LOG_INFO("Executor: " + call_id + " " + tool_name +
                           " not admitted by bulkhead [" + admission->code + "]");
        return *admission;
    }
    resilience::BulkheadPermit permit(bulkhead_);

    if (auto rejection = breakers_.check(tool_name)) {
        TOOLGUARD_LOG_INFO("Executor: " + call_id + " " + tool_name +
                           " rejected, circuit open");
        return *rejection;
    }

    const int max_attempts = retry_policy_.max_attempts(tool);
    std::chrono::nanoseconds total{0};

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        core::errors::Result<ToolResult> outcome = Error{ErrorCategory::Internal, ""};
        {
            const auto scope = timeout_guard_.wrap(caller);
            const auto started = Clock::now();
            outcome = run_attempt(tool, scope.context(), input);
            total += Clock::now() - started;

            if (core::errors::is_error(outcome) && !caller->is_done() &&
                scope.context().is_done()) {
                Error timed_out = core::errors::get_error(outcome);
                timed_out.category = ErrorCategory::Timeout;
                timed_out.code = core::errors::codes::kAttemptTimeout;
                timed_out.message = "Attempt " + std::to_string(attempt) +
                                    " timed out after " +
                                    millis_text(timeout_guard_.timeout()) + ": " +
                                    timed_out.message;
                outcome = timed_out;
            }
        }

        if (!core::errors::is_error(outcome)) {
            breakers_.record_success(tool_name);
            ExecutionResult result;
            result.output = core::errors::get_value(outcome).output;
            result.duration = total;
            result.attempts = attempt;
            TOOLGUARD_LOG_DEBUG("Executor: " + call_id + " " + tool_name +
                                " succeeded on attempt " + std::to_string(attempt) +
                                " in " + millis_text(total));
            return result;
        }

        breakers_.record_failure(tool_name);
        Error failure = core::errors::get_error(outcome);

        if (attempt == max_attempts || !retry_policy_.is_retryable(failure, *caller)) {
            if (attempt < max_attempts) {
                TOOLGUARD_LOG_INFO("Executor: " + call_id + " " + tool_name +
                                   " caller finished after attempt " +
                                   std::to_string(attempt) + ", not retrying");
            } else if (max_attempts > 1) {
                TOOLGUARD_LOG_WARN("Executor: " + call_id + " " + tool_name +
                                   " exhausted " + std::to_string(attempt) +
                                   " attempt(s) [" + failure.code + "]: " +
                                   failure.message);
            }
            return core::errors::wrap_with_attempts(std::move(failure), tool_name,
                                                    attempt);
        }

        const auto delay = retry_policy_.next_delay(attempt);
        TOOLGUARD_LOG_DEBUG("Executor: " + call_id + " " + tool_name + " attempt " +
                            std::to_string(attempt) + " failed [" + failure.code +
                            "], retrying in " + millis_text(delay));
        if (!caller->sleep_for(delay)) {
            auto caller_err = caller->err();
            return core::errors::wrap_with_attempts(
                caller_err.has_value() ? *caller_err : core::errors::cancelled_error(),
                tool_name, attempt);
        }
    }

    // Unreachable: max_attempts is at least 1 and every iteration returns or
    // continues to a later attempt.
    return Error{ErrorCategory::Internal, "Retry loop ended without an outcome.",
                 "retry_loop_exhausted"};
}

core::errors::Result<ExecutionResult> ResilientExecutor::execute_with_timeout(
    const std::shared_ptr<Context>& ctx, tools::Tool& tool,
    const nlohmann::json& input, const std::chrono::milliseconds timeout) {
    const auto bounded = Context::with_timeout(ctx, timeout);
    auto result = execute(bounded, tool, input);
    bounded->cancel();
    return result;
}

core::errors::Result<ExecutionResult> ResilientExecutor::execute_simple(
    const std::shared_ptr<Context>& ctx, tools::Tool& tool,
    const nlohmann::json& input) const {
    const std::shared_ptr<Context> caller = ctx ? ctx : Context::background();
    const auto started = Clock::now();
    auto outcome = run_attempt(tool, *caller, input);
    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }

    ExecutionResult result;
    result.output = core::errors::get_value(outcome).output;
    result.duration = Clock::now() - started;
    result.attempts = 1;
    return result;
}

resilience::CircuitPhase ResilientExecutor::circuit_phase(
    const std::string& tool_name) const {
    return breakers_.phase(tool_name);
}

resilience::CircuitSnapshot ResilientExecutor::circuit_snapshot(
    const std::string& tool_name) const {
    return breakers_.snapshot(tool_name);
}

const core::config::ExecutorConfig& ResilientExecutor::config() const {
    return config_;
}

void ResilientExecutor::reset() {}

std::unique_ptr<ResilientExecutor> make_executor(
    const std::vector<core::config::Option>& options) {
    return std::make_unique<ResilientExecutor>(core::config::apply_options(
        core::config::default_executor_config(), options));
}

}  // namespace toolguard::runtime
