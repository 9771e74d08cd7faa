#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include "core/context/context.hpp"
#include "core/errors/errors.hpp"

namespace toolguard::resilience {

// Counting semaphore capping how many tool executions run at once.
class Bulkhead {
public:
    explicit Bulkhead(int capacity);

    Bulkhead(const Bulkhead&) = delete;
    Bulkhead& operator=(const Bulkhead&) = delete;

    // Blocks until a slot is free or ctx finishes. Returns ctx's error in the
    // latter case. No ordering between waiters is guaranteed.
    std::optional<core::errors::Error> acquire(const core::context::Context& ctx);

    // Never blocks.
    void release();

    int capacity() const;
    int in_use() const;

private:
    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    int in_use_ = 0;
};

// Owns one slot that was already acquired and returns it on destruction.
class BulkheadPermit {
public:
    explicit BulkheadPermit(Bulkhead& bulkhead) : bulkhead_(&bulkhead) {}
    ~BulkheadPermit() {
        if (bulkhead_ != nullptr) {
            bulkhead_->release();
        }
    }

    BulkheadPermit(const BulkheadPermit&) = delete;
    BulkheadPermit& operator=(const BulkheadPermit&) = delete;

private:
    Bulkhead* bulkhead_;
};

}  // namespace toolguard::resilience
