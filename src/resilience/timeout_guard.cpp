#include "resilience/timeout_guard.hpp"

namespace toolguard::resilience {

using core::context::Context;

TimeoutGuard::TimeoutGuard(const std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {}

AttemptScope TimeoutGuard::wrap(const std::shared_ptr<Context>& parent) const {
    return wrap(parent, default_timeout_);
}

AttemptScope TimeoutGuard::wrap(const std::shared_ptr<Context>& parent,
                                const std::chrono::milliseconds timeout) const {
    return AttemptScope(Context::with_timeout(parent, timeout));
}

std::chrono::milliseconds TimeoutGuard::timeout() const {
    return default_timeout_;
}

}  // namespace toolguard::resilience
