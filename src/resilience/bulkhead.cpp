#include "resilience/bulkhead.hpp"

namespace toolguard::resilience {

Bulkhead::Bulkhead(const int capacity) : capacity_(capacity > 0 ? capacity : 1) {}

std::optional<core::errors::Error> Bulkhead::acquire(
    const core::context::Context& ctx) {
    if (auto err = ctx.err()) {
        return err;
    }

    // Wake this waiter when ctx is cancelled. Deadlines bound the wait below.
    const auto callback_id = ctx.add_done_callback([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_freed_.notify_all();
    });

    std::optional<core::errors::Error> failure;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (in_use_ >= capacity_) {
            failure = ctx.err();
            if (failure.has_value()) {
                break;
            }
            const auto deadline = ctx.deadline();
            if (deadline.has_value()) {
                slot_freed_.wait_until(lock, *deadline);
            } else {
                slot_freed_.wait(lock);
            }
        }
        if (!failure.has_value()) {
            ++in_use_;
        }
    }

    ctx.remove_done_callback(callback_id);
    return failure;
}

void Bulkhead::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    // A waiter may be on its way out after cancellation; wake them all.
    slot_freed_.notify_all();
}

int Bulkhead::capacity() const {
    return capacity_;
}

int Bulkhead::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

}  // namespace toolguard::resilience
