#include "core/context/context.hpp"

#include <algorithm>
#include <utility>

namespace toolguard::core::context {

Context::Context(const bool cancellable,
                 const std::optional<Clock::time_point> deadline)
    : cancellable_(cancellable), deadline_(deadline) {}

std::shared_ptr<Context> Context::background() {
    static const std::shared_ptr<Context> root(new Context(false, std::nullopt));
    return root;
}

std::shared_ptr<Context> Context::with_cancel(const std::shared_ptr<Context>& parent) {
    return derive(parent, std::nullopt);
}

std::shared_ptr<Context> Context::with_deadline(const std::shared_ptr<Context>& parent,
                                                const Clock::time_point deadline) {
    return derive(parent, deadline);
}

std::shared_ptr<Context> Context::with_timeout(const std::shared_ptr<Context>& parent,
                                               const Clock::duration timeout) {
    return derive(parent, Clock::now() + timeout);
}

std::shared_ptr<Context> Context::derive(const std::shared_ptr<Context>& parent,
                                         std::optional<Clock::time_point> deadline) {
    const std::shared_ptr<Context> base = parent ? parent : background();

    const auto parent_deadline = base->deadline();
    if (parent_deadline.has_value()) {
        deadline = deadline.has_value() ? std::min(*deadline, *parent_deadline)
                                        : *parent_deadline;
    }

    std::shared_ptr<Context> child(new Context(true, deadline));
    if (!base->cancellable_) {
        return child;
    }

    std::optional<DoneReason> inherited;
    {
        std::lock_guard<std::mutex> lock(base->mutex_);
        if (base->reason_.has_value()) {
            inherited = base->reason_;
        } else {
            auto& siblings = base->children_;
            siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                          [](const std::weak_ptr<Context>& weak) {
                                              return weak.expired();
                                          }),
                           siblings.end());
            siblings.push_back(child);
        }
    }
    if (inherited.has_value()) {
        child->finish(*inherited);
    }
    return child;
}

void Context::cancel() {
    if (!cancellable_) {
        return;
    }
    finish(DoneReason::Cancelled);
}

void Context::finish(const DoneReason reason) {
    std::vector<std::weak_ptr<Context>> children;
    std::vector<std::function<void()>> callbacks;
    DoneReason recorded = reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_.has_value()) {
            return;
        }
        // An expired deadline keeps priority over a later cancel.
        if (deadline_.has_value() && Clock::now() >= *deadline_) {
            recorded = DoneReason::DeadlineExceeded;
        }
        reason_ = recorded;
        children.swap(children_);
        callbacks.reserve(callbacks_.size());
        for (auto& entry : callbacks_) {
            callbacks.push_back(std::move(entry.second));
        }
        callbacks_.clear();
        callbacks_running_ = !callbacks.empty();
        callback_thread_ = std::this_thread::get_id();
    }
    cv_.notify_all();

    if (!callbacks.empty()) {
        for (auto& callback : callbacks) {
            callback();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks_running_ = false;
        }
        cv_.notify_all();
    }
    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            child->finish(recorded);
        }
    }
}

bool Context::refresh_locked() const {
    if (reason_.has_value()) {
        return true;
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        reason_ = DoneReason::DeadlineExceeded;
        return true;
    }
    return false;
}

bool Context::is_done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_locked();
}

std::optional<errors::Error> Context::err() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!refresh_locked()) {
        return std::nullopt;
    }
    if (*reason_ == DoneReason::DeadlineExceeded) {
        return errors::deadline_exceeded_error();
    }
    return errors::cancelled_error();
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    return deadline_;
}

std::optional<Context::Clock::duration> Context::remaining() const {
    if (!deadline_.has_value()) {
        return std::nullopt;
    }
    const auto left = *deadline_ - Clock::now();
    return left > Clock::duration::zero() ? left : Clock::duration::zero();
}

bool Context::sleep_for(const Clock::duration duration) const {
    const auto wake_at = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!refresh_locked()) {
        const auto now = Clock::now();
        if (now >= wake_at) {
            return true;
        }
        auto until = wake_at;
        if (deadline_.has_value() && *deadline_ < until) {
            until = *deadline_;
        }
        cv_.wait_until(lock, until);
    }
    return false;
}

Context::CallbackId Context::add_done_callback(std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reason_.has_value()) {
            const CallbackId id = next_callback_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void Context::remove_done_callback(const CallbackId id) const {
    if (id == 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    if (callbacks_.erase(id) > 0 || callback_thread_ == std::this_thread::get_id()) {
        return;
    }
    // Already taken by finish(); wait until it has run.
    cv_.wait(lock, [this]() { return !callbacks_running_; });
}

}  // namespace toolguard::core::context
