#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "procpool/cancellation.hpp"
#include "procpool/completion.hpp"

using namespace procpool;

TEST(TaskPromiseTest, FirstCompletionWins) {
    TaskPromise promise;
    auto future = promise.future();
    EXPECT_FALSE(future.ready());

    EXPECT_TRUE(promise.tryComplete(TaskResult::exitFailure(2)));
    EXPECT_FALSE(promise.tryComplete(TaskResult::success()));

    ASSERT_TRUE(future.ready());
    EXPECT_EQ(future.wait().exitCode, 2);
}

TEST(TaskPromiseTest, CallbacksRunOnceBeforeAndAfterCompletion) {
    TaskPromise promise;
    auto future = promise.future();
    int before = 0;
    int after = 0;

    future.onComplete([&before](const TaskResult& r) { if (r) ++before; });
    promise.tryComplete(TaskResult::success());
    promise.tryComplete(TaskResult::success());
    future.onComplete([&after](const TaskResult& r) { if (r) ++after; });

    EXPECT_EQ(before, 1);
    EXPECT_EQ(after, 1);
}

TEST(TaskPromiseTest, ThrowingCallbackDoesNotStopOthers) {
    TaskPromise promise;
    bool second = false;
    promise.future().onComplete([](const TaskResult&) { throw std::runtime_error("callback"); });
    promise.future().onComplete([&second](const TaskResult&) { second = true; });

    EXPECT_TRUE(promise.tryComplete(TaskResult::success()));
    EXPECT_TRUE(second);
}

TEST(TaskPromiseTest, WaitForTimesOutThenSeesResult) {
    TaskPromise promise;
    auto future = promise.future();
    EXPECT_FALSE(future.waitFor(std::chrono::milliseconds(20)).has_value());

    std::thread worker([promise]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        promise.tryComplete(TaskResult::cancelled());
    });
    auto result = future.waitFor(std::chrono::seconds(5));
    worker.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->error, TaskError::Cancelled);
}

TEST(TaskPromiseTest, CompleteWithForwardsResult) {
    TaskPromise source;
    TaskPromise target;
    target.completeWith(source.future());
    EXPECT_FALSE(target.completed());

    source.tryComplete(TaskResult::exitFailure(9));
    ASSERT_TRUE(target.completed());
    EXPECT_EQ(target.future().wait().exitCode, 9);
}

TEST(TaskFutureTest, DefaultFutureHasNoState) {
    TaskFuture future;
    EXPECT_FALSE(future.valid());
    EXPECT_THROW((void)future.ready(), std::logic_error);
    EXPECT_TRUE(TaskFuture::completed(TaskResult::success()).ready());
}

TEST(CancellationTest, HooksFireOnceInRegistrationOrder) {
    CancellationSource source;
    auto token = source.token();
    std::vector<int> order;

    token.onCancel([&order] { order.push_back(1); });
    token.onCancel([&order] { order.push_back(2); });
    EXPECT_FALSE(token.cancelled());

    EXPECT_TRUE(source.cancel());
    EXPECT_FALSE(source.cancel());
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(CancellationTest, LateRegistrationRunsImmediately) {
    CancellationSource source;
    source.cancel();

    bool fired = false;
    auto registration = source.token().onCancel([&fired] { fired = true; });
    EXPECT_TRUE(fired);
    EXPECT_EQ(registration, CancellationToken::kNoRegistration);
}

TEST(CancellationTest, UnregisteredHookDoesNotFire) {
    CancellationSource source;
    bool fired = false;
    auto registration = source.token().onCancel([&fired] { fired = true; });
    source.token().unregister(registration);
    source.cancel();
    EXPECT_FALSE(fired);
}

TEST(CancellationTest, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    bool fired = false;
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_EQ(token.onCancel([&fired] { fired = true; }), CancellationToken::kNoRegistration);
    EXPECT_FALSE(token.cancelled());
    EXPECT_FALSE(fired);
}

TEST(CancellationTest, ConcurrentCancelRunsHookOnce) {
    CancellationSource source;
    std::atomic<int> fired{0};
    source.token().onCancel([&fired] { ++fired; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&source] { source.cancel(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(fired.load(), 1);
}
