/**
 * @file TimeLimiterTest.cpp
 * @brief Unit tests for TimeLimiter
 */

#include <gtest/gtest.h>
#include "resilience/TimeLimiter.hpp"
#include "domain/Errors.hpp"
#include <atomic>
#include <memory>
#include <thread>

using namespace ordercore;
using namespace ordercore::resilience;
using namespace std::chrono_literals;

TEST(TimeLimiterTest, FastCall_ReturnsValue) {
    TimeLimiter limiter(500ms, 2);

    EXPECT_EQ(limiter.execute<int>([] { return 42; }), 42);
}

TEST(TimeLimiterTest, CallException_Propagates) {
    TimeLimiter limiter(500ms, 2);

    EXPECT_THROW(limiter.execute<int>([]() -> int { throw domain::GatewayRejectedError("HTTP 422"); }),
                 domain::GatewayRejectedError);
}

TEST(TimeLimiterTest, SlowCall_TimesOutWithoutWaitingForIt) {
    TimeLimiter limiter(50ms, 2);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(limiter.execute<int>([] {
        std::this_thread::sleep_for(300ms);
        return 1;
    }), domain::GatewayTimeoutError);

    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
}

// Брошенный вызов держит свой поток, остальные потоки пула продолжают работать
TEST(TimeLimiterTest, AbandonedCall_KeepsThread_OtherThreadsServeNextCalls) {
    TimeLimiter limiter(50ms, 2);

    EXPECT_THROW(limiter.execute<int>([] {
        std::this_thread::sleep_for(300ms);
        return 1;
    }), domain::GatewayTimeoutError);

    EXPECT_EQ(limiter.execute<int>([] { return 7; }), 7);
}

TEST(TimeLimiterTest, AllThreadsHung_NextCallTimesOutInQueue) {
    TimeLimiter limiter(50ms, 1);
    auto ran = std::make_shared<std::atomic<bool>>(false);

    EXPECT_THROW(limiter.execute<int>([] {
        std::this_thread::sleep_for(300ms);
        return 1;
    }), domain::GatewayTimeoutError);

    EXPECT_THROW(limiter.execute<int>([ran] {
        *ran = true;
        return 2;
    }), domain::GatewayTimeoutError);
    EXPECT_FALSE(ran->load());
}

TEST(TimeLimiterTest, Destructor_WaitsForAbandonedCall) {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto start = std::chrono::steady_clock::now();
    {
        TimeLimiter limiter(20ms, 1);
        EXPECT_THROW(limiter.execute<int>([finished] {
            std::this_thread::sleep_for(200ms);
            *finished = true;
            return 1;
        }), domain::GatewayTimeoutError);
    }

    EXPECT_TRUE(finished->load());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 200ms);
}
