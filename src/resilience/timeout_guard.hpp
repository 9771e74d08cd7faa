#pragma once

#include <chrono>
#include <memory>
#include <utility>
#include "core/context/context.hpp"

namespace toolguard::resilience {

// Owns the context of one attempt and cancels it when the attempt ends,
// whatever the outcome.
class AttemptScope {
public:
    explicit AttemptScope(std::shared_ptr<core::context::Context> ctx)
        : ctx_(std::move(ctx)) {}
    ~AttemptScope() {
        if (ctx_) {
            ctx_->cancel();
        }
    }

    AttemptScope(AttemptScope&& other) noexcept : ctx_(std::move(other.ctx_)) {}
    AttemptScope(const AttemptScope&) = delete;
    AttemptScope& operator=(const AttemptScope&) = delete;
    AttemptScope& operator=(AttemptScope&&) = delete;

    const core::context::Context& context() const { return *ctx_; }
    const std::shared_ptr<core::context::Context>& shared_context() const { return ctx_; }

private:
    std::shared_ptr<core::context::Context> ctx_;
};

class TimeoutGuard {
public:
    explicit TimeoutGuard(std::chrono::milliseconds default_timeout);

    // Deadline is min(parent deadline, now + default timeout). Every call
    // yields a fresh context, so one timed-out attempt never leaks into the
    // next.
    AttemptScope wrap(const std::shared_ptr<core::context::Context>& parent) const;
    AttemptScope wrap(const std::shared_ptr<core::context::Context>& parent,
                      std::chrono::milliseconds timeout) const;

    std::chrono::milliseconds timeout() const;

private:
    std::chrono::milliseconds default_timeout_;
};

}  // namespace toolguard::resilience
