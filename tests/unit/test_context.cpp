#include <atomic>
#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "core/context/context.hpp"
#include "core/errors/errors.hpp"

namespace {

using namespace std::chrono_literals;
using toolguard::core::context::Context;
namespace codes = toolguard::core::errors::codes;

TEST(ContextTest, BackgroundIsNeverDone) {
    auto root = Context::background();
    root->cancel();
    EXPECT_FALSE(root->is_done());
    EXPECT_FALSE(root->err().has_value());
    EXPECT_FALSE(root->deadline().has_value());
}

TEST(ContextTest, CancelMarksContextCancelled) {
    auto ctx = Context::with_cancel(Context::background());
    EXPECT_FALSE(ctx->is_done());

    ctx->cancel();
    ASSERT_TRUE(ctx->err().has_value());
    EXPECT_EQ(ctx->err()->code, codes::kContextCancelled);

    ctx->cancel();
    EXPECT_EQ(ctx->err()->code, codes::kContextCancelled);
}

TEST(ContextTest, CancelPropagatesToChildrenOnly) {
    auto parent = Context::with_cancel(Context::background());
    auto child = Context::with_cancel(parent);
    auto grandchild = Context::with_timeout(child, 10s);

    child->cancel();
    EXPECT_TRUE(child->is_done());
    EXPECT_TRUE(grandchild->is_done());
    EXPECT_FALSE(parent->is_done());
}

TEST(ContextTest, ChildOfCancelledParentStartsDone) {
    auto parent = Context::with_cancel(Context::background());
    parent->cancel();

    auto child = Context::with_cancel(parent);
    ASSERT_TRUE(child->err().has_value());
    EXPECT_EQ(child->err()->code, codes::kContextCancelled);
}

TEST(ContextTest, DeadlineExpiresContext) {
    auto ctx = Context::with_timeout(Context::background(), 20ms);
    EXPECT_FALSE(ctx->is_done());

    std::this_thread::sleep_for(40ms);
    ASSERT_TRUE(ctx->err().has_value());
    EXPECT_EQ(ctx->err()->code, codes::kDeadlineExceeded);

    // A later cancel does not rewrite the reason.
    ctx->cancel();
    EXPECT_EQ(ctx->err()->code, codes::kDeadlineExceeded);
}

TEST(ContextTest, ChildDeadlineNeverExceedsParent) {
    auto parent = Context::with_timeout(Context::background(), 50ms);
    auto child = Context::with_timeout(parent, 10s);

    ASSERT_TRUE(parent->deadline().has_value());
    ASSERT_TRUE(child->deadline().has_value());
    EXPECT_EQ(*child->deadline(), *parent->deadline());

    auto tighter = Context::with_timeout(parent, 5ms);
    EXPECT_LT(*tighter->deadline(), *parent->deadline());
}

TEST(ContextTest, SleepCompletesWhenNotCancelled) {
    auto ctx = Context::with_cancel(Context::background());
    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx->sleep_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 20ms);
}

TEST(ContextTest, SleepReturnsEarlyOnCancel) {
    auto ctx = Context::with_cancel(Context::background());
    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(20ms);
        ctx->cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx->sleep_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    canceller.join();
}

TEST(ContextTest, SleepReturnsEarlyAtDeadline) {
    auto ctx = Context::with_timeout(Context::background(), 20ms);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx->sleep_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    EXPECT_EQ(ctx->err()->code, codes::kDeadlineExceeded);
}

TEST(ContextTest, DoneCallbacksRunOnCancel) {
    auto ctx = Context::with_cancel(Context::background());
    std::atomic<int> fired{0};
    ctx->add_done_callback([&fired]() { ++fired; });
    const auto removed = ctx->add_done_callback([&fired]() { fired += 100; });
    ctx->remove_done_callback(removed);

    ctx->cancel();
    EXPECT_EQ(fired.load(), 1);

    // Registering on a finished context runs the callback right away.
    ctx->add_done_callback([&fired]() { ++fired; });
    EXPECT_EQ(fired.load(), 2);
}

TEST(ContextTest, RemoveWaitsForRunningCallback) {
    auto ctx = Context::with_cancel(Context::background());
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    const auto id = ctx->add_done_callback([&started, &finished]() {
        started = true;
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    std::thread canceller([ctx]() { ctx->cancel(); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    ctx->remove_done_callback(id);
    EXPECT_TRUE(finished.load());
    canceller.join();
}

TEST(ContextTest, CallbackMayRemoveItself) {
    auto ctx = Context::with_cancel(Context::background());
    std::atomic<Context::CallbackId> own_id{0};
    std::atomic<bool> fired{false};
    own_id = ctx->add_done_callback([&ctx, &own_id, &fired]() {
        ctx->remove_done_callback(own_id.load());
        fired = true;
    });

    ctx->cancel();
    EXPECT_TRUE(fired.load());
}

}  // namespace
