#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/errors/errors.hpp"

namespace toolguard::core::context {

// Cooperative cancellation scope handed to every blocking operation.
//
// A context finishes either when cancel() is called on it or one of its
// ancestors, or when its deadline passes. A derived context never outlives
// its parent's deadline. Cancellation flows from parent to child only.
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using CallbackId = std::size_t;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Root context: never cancelled, no deadline.
    static std::shared_ptr<Context> background();

    static std::shared_ptr<Context> with_cancel(const std::shared_ptr<Context>& parent);
    static std::shared_ptr<Context> with_deadline(const std::shared_ptr<Context>& parent,
                                                  Clock::time_point deadline);
    static std::shared_ptr<Context> with_timeout(const std::shared_ptr<Context>& parent,
                                                 Clock::duration timeout);

    // Idempotent. The first reason recorded wins.
    void cancel();

    bool is_done() const;
    std::optional<errors::Error> err() const;
    std::optional<Clock::time_point> deadline() const;
    std::optional<Clock::duration> remaining() const;

    // Blocks for `duration` unless the context finishes first.
    // Returns true when the full duration elapsed.
    bool sleep_for(Clock::duration duration) const;

    // Runs `callback` once when the context is cancelled (immediately if it
    // already is). Deadline expiry does not fire callbacks; waiters are
    // expected to bound their own waits with deadline().
    CallbackId add_done_callback(std::function<void()> callback) const;

    // Once this returns, the callback will not start and is not running,
    // unless it is called from inside a done callback.
    void remove_done_callback(CallbackId id) const;

private:
    enum class DoneReason { Cancelled, DeadlineExceeded };

    Context(bool cancellable, std::optional<Clock::time_point> deadline);

    static std::shared_ptr<Context> derive(const std::shared_ptr<Context>& parent,
                                           std::optional<Clock::time_point> deadline);
    void finish(DoneReason reason);
    bool refresh_locked() const;

    const bool cancellable_;
    const std::optional<Clock::time_point> deadline_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable std::optional<DoneReason> reason_;
    mutable std::vector<std::weak_ptr<Context>> children_;
    mutable std::unordered_map<CallbackId, std::function<void()>> callbacks_;
    mutable CallbackId next_callback_id_ = 1;
    mutable bool callbacks_running_ = false;
    mutable std::thread::id callback_thread_;
};

}  // namespace toolguard::core::context
