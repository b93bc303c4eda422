/**
 * @file PaymentTaskTest.cpp
 * @brief Unit tests for the asynchronous payment handle
 */

#include <gtest/gtest.h>
#include "domain/PaymentTask.hpp"
#include "domain/Errors.hpp"
#include <functional>
#include <thread>
#include <vector>

using namespace ordercore::domain;

TEST(PaymentTaskTest, GetReturnsCompletedResult) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);

    EXPECT_FALSE(task.isReady());
    state->complete(PaymentResult::ok("txn-1"));

    EXPECT_TRUE(task.isReady());
    auto result = task.get();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transactionId.value_or(""), "txn-1");
    EXPECT_FALSE(result.message.has_value());
}

TEST(PaymentTaskTest, ThenBeforeCompletion_RunsOnCompletingThread) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);

    std::thread::id callbackThread;
    bool called = false;
    task.then([&](const PaymentResult& r) {
        called = true;
        callbackThread = std::this_thread::get_id();
        EXPECT_FALSE(r.success);
    });

    std::thread worker([state] { state->complete(PaymentResult::fallback()); });
    std::thread::id workerId = worker.get_id();
    worker.join();

    EXPECT_TRUE(called);
    EXPECT_EQ(callbackThread, workerId);
}

TEST(PaymentTaskTest, ThenAfterCompletion_RunsImmediately) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);
    state->complete(PaymentResult::failed("card declined"));

    std::string seen;
    task.then([&](const PaymentResult& r) { seen = r.message.value_or(""); });
    EXPECT_EQ(seen, "card declined");
}

TEST(PaymentTaskTest, ThenAfterCompletion_WithDispatcher_GoesThroughDispatcher) {
    std::vector<std::function<void()>> queued;
    auto state = PaymentTask::makeState([&queued](std::function<void()> job) {
        queued.push_back(std::move(job));
    });
    PaymentTask task(state);
    state->complete(PaymentResult::fallback());

    bool called = false;
    task.then([&called](const PaymentResult& r) {
        called = true;
        EXPECT_FALSE(r.success);
    });

    EXPECT_FALSE(called);
    ASSERT_EQ(queued.size(), 1u);
    queued[0]();
    EXPECT_TRUE(called);
}

TEST(PaymentTaskTest, SecondCompletionIgnored) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);

    state->complete(PaymentResult::ok("first"));
    state->complete(PaymentResult::ok("second"));

    EXPECT_EQ(task.get().transactionId.value_or(""), "first");
}

TEST(PaymentTaskTest, ThrowingContinuationDoesNotBreakOthers) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);

    int calls = 0;
    task.then([](const PaymentResult&) { throw std::runtime_error("boom"); });
    task.then([&](const PaymentResult&) { ++calls; });

    state->complete(PaymentResult::ok("txn"));
    EXPECT_EQ(calls, 1);
}

TEST(PaymentTaskTest, FailedTaskRethrowsOnGet) {
    auto state = PaymentTask::makeState();
    PaymentTask task(state);

    task.cancel();
    EXPECT_TRUE(task.isCancelled());
    state->fail(std::make_exception_ptr(PaymentCancelledError("cancelled")));

    EXPECT_TRUE(task.waitFor(std::chrono::milliseconds(10)));
    EXPECT_THROW(task.get(), PaymentCancelledError);
}

TEST(PaymentResultTest, FallbackMessage) {
    auto r = PaymentResult::fallback();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message.value_or(""), "payment service temporarily unavailable");
    EXPECT_FALSE(r.transactionId.has_value());
}
