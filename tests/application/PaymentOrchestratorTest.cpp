/**
 * @file PaymentOrchestratorTest.cpp
 * @brief Unit tests for PaymentOrchestrator (breaker + retry + timeout + fallback)
 */

#include <gtest/gtest.h>
#include "application/PaymentOrchestrator.hpp"
#include "domain/Errors.hpp"
#include "../mocks/StubPaymentGateway.hpp"
#include <future>
#include <thread>
#include <vector>

using namespace ordercore;
using namespace ordercore::application;
using namespace ordercore::tests;
using namespace std::chrono_literals;

class PaymentOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway_ = std::make_shared<StubPaymentGateway>();
        registry_ = std::make_shared<resilience::CircuitBreakerRegistry>();

        breakerConfig_.waitDurationInOpenState = 30000ms;
        retryConfig_.maxAttempts = 1;
        retryConfig_.waitDuration = 10ms;
    }

    std::unique_ptr<PaymentOrchestrator> makeOrchestrator(std::chrono::milliseconds timeout = 1000ms) {
        return std::make_unique<PaymentOrchestrator>(
            gateway_, registry_,
            settings::ResilienceSettings::custom(breakerConfig_, retryConfig_, timeout));
    }

    static const std::string& fallbackMessage() {
        static const std::string message = domain::PaymentResult::FALLBACK_MESSAGE;
        return message;
    }

    std::shared_ptr<StubPaymentGateway> gateway_;
    std::shared_ptr<resilience::CircuitBreakerRegistry> registry_;
    resilience::CircuitBreakerConfig breakerConfig_;
    resilience::RetryConfig retryConfig_;
};

// ============================================================================
// HAPPY PATH
// ============================================================================

TEST_F(PaymentOrchestratorTest, Approved_ReturnsTransaction) {
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(42).get();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transactionId, "txn-42");
    EXPECT_FALSE(result.message.has_value());
    EXPECT_EQ(gateway_->callCount(), 1);
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::CLOSED);
}

TEST_F(PaymentOrchestratorTest, ProcessPayment_ReturnsBeforeGatewayAnswers) {
    gateway_->hangFor(200ms);
    auto orchestrator = makeOrchestrator();

    auto start = std::chrono::steady_clock::now();
    auto task = orchestrator->processPayment(7);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 100ms);
    EXPECT_FALSE(task.isReady());
    EXPECT_TRUE(task.waitFor(2s));
    EXPECT_EQ(task.get().transactionId, "late-7");
}

TEST_F(PaymentOrchestratorTest, Then_ReceivesResult) {
    auto orchestrator = makeOrchestrator();

    std::promise<domain::PaymentResult> received;
    auto future = received.get_future();

    auto task = orchestrator->processPayment(5);
    task.then([&received](const domain::PaymentResult& r) { received.set_value(r); });

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().transactionId, "txn-5");
}

// Задача уже готова к моменту then(): продолжение не должно занять поток вызывающего
TEST_F(PaymentOrchestratorTest, Then_OnSettledTask_RunsOnExecutor) {
    auto orchestrator = makeOrchestrator();
    auto task = orchestrator->processPayment(0);
    ASSERT_TRUE(task.isReady());

    std::promise<std::thread::id> ranOn;
    auto future = ranOn.get_future();
    task.then([&ranOn](const domain::PaymentResult&) { ranOn.set_value(std::this_thread::get_id()); });

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST_F(PaymentOrchestratorTest, ConcurrentPayments_AllComplete) {
    auto orchestrator = makeOrchestrator();

    std::vector<domain::PaymentTask> tasks;
    for (int64_t id = 1; id <= 20; ++id) {
        tasks.push_back(orchestrator->processPayment(id));
    }

    for (size_t i = 0; i < tasks.size(); ++i) {
        auto result = tasks[i].get();
        EXPECT_TRUE(result.success);
        EXPECT_EQ(result.transactionId, "txn-" + std::to_string(i + 1));
    }
    EXPECT_EQ(gateway_->callCount(), 20);
}

// ============================================================================
// BUSINESS FAILURES
// ============================================================================

TEST_F(PaymentOrchestratorTest, Declined_FailedWithReason_CountsAsSuccess) {
    gateway_->declineAll("insufficient funds");
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(1).get();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "insufficient funds");

    auto metrics = orchestrator->circuitBreaker()->metrics();
    EXPECT_EQ(metrics.bufferedCalls, 1u);
    EXPECT_EQ(metrics.failedCalls, 0u);
}

TEST_F(PaymentOrchestratorTest, Rejected_NotRetried_NotCountedByBreaker) {
    retryConfig_.maxAttempts = 3;
    gateway_->rejectAll();
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(1).get();

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.message.has_value());
    EXPECT_EQ(result.message->rfind("payment rejected:", 0), 0u);
    EXPECT_EQ(gateway_->callCount(), 1);
    EXPECT_EQ(orchestrator->circuitBreaker()->metrics().bufferedCalls, 0u);
}

TEST_F(PaymentOrchestratorTest, InvalidOrderId_FailsWithoutGateway) {
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(0).get();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "invalid order id");
    EXPECT_EQ(gateway_->callCount(), 0);
}

// ============================================================================
// RETRY
// ============================================================================

TEST_F(PaymentOrchestratorTest, TransientFailures_RetriedUntilSuccess) {
    retryConfig_.maxAttempts = 3;
    gateway_->failFirst(2);
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(9).get();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transactionId, "txn-9");
    EXPECT_EQ(gateway_->callCount(), 3);

    auto metrics = orchestrator->circuitBreaker()->metrics();
    EXPECT_EQ(metrics.bufferedCalls, 3u);
    EXPECT_EQ(metrics.failedCalls, 2u);
}

TEST_F(PaymentOrchestratorTest, RetriesExhausted_Fallback) {
    retryConfig_.maxAttempts = 3;
    gateway_->failAlways();
    auto orchestrator = makeOrchestrator();

    auto result = orchestrator->processPayment(1).get();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, fallbackMessage());
    EXPECT_EQ(gateway_->callCount(), 3);
}

TEST_F(PaymentOrchestratorTest, EachAttemptIsOneBreakerCall) {
    retryConfig_.maxAttempts = 3;
    gateway_->failAlways();
    auto orchestrator = makeOrchestrator();

    orchestrator->processPayment(1).get();
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::CLOSED);

    // Вторая оплата: 4-я и 5-я попытки открывают breaker, 3-я отклонена
    auto result = orchestrator->processPayment(2).get();

    EXPECT_EQ(result.message, fallbackMessage());
    EXPECT_EQ(gateway_->callCount(), 5);
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::OPEN);
}

TEST_F(PaymentOrchestratorTest, Cancelled_DuringBackoff) {
    retryConfig_.maxAttempts = 3;
    retryConfig_.waitDuration = 5000ms;
    gateway_->failAlways();
    auto orchestrator = makeOrchestrator();

    auto task = orchestrator->processPayment(1);
    while (gateway_->callCount() < 1) {
        std::this_thread::sleep_for(1ms);
    }

    auto start = std::chrono::steady_clock::now();
    task.cancel();

    EXPECT_THROW(task.get(), domain::PaymentCancelledError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(gateway_->callCount(), 1);
}

// ============================================================================
// TIMEOUT
// ============================================================================

TEST_F(PaymentOrchestratorTest, HangingGateway_TimesOutToFallback) {
    gateway_->hangFor(500ms);
    auto orchestrator = makeOrchestrator(100ms);

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator->processPayment(1).get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, fallbackMessage());
    EXPECT_LT(elapsed, 400ms);
    EXPECT_EQ(orchestrator->circuitBreaker()->metrics().failedCalls, 1u);
}

// Каждая попытка ограничена timeout, поэтому fallback приходит за timeout * attempts + паузы
TEST_F(PaymentOrchestratorTest, HangingGateway_WithRetries_FallbackWithinBudget) {
    retryConfig_.maxAttempts = 3;
    retryConfig_.waitDuration = 10ms;
    gateway_->hangFor(500ms);
    auto orchestrator = makeOrchestrator(100ms);

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator->processPayment(1).get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, fallbackMessage());
    EXPECT_EQ(gateway_->callCount(), 3);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 700ms);

    auto metrics = orchestrator->circuitBreaker()->metrics();
    EXPECT_EQ(metrics.failedCalls, 3u);
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::CLOSED);
}

// ============================================================================
// CIRCUIT BREAKER
// ============================================================================

TEST_F(PaymentOrchestratorTest, FiveFailures_SixthShortCircuited) {
    gateway_->failAlways();
    auto orchestrator = makeOrchestrator();

    for (int64_t id = 1; id <= 5; ++id) {
        auto result = orchestrator->processPayment(id).get();
        EXPECT_EQ(result.message, fallbackMessage());
    }
    EXPECT_EQ(gateway_->callCount(), 5);
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::OPEN);

    auto start = std::chrono::steady_clock::now();
    auto sixth = orchestrator->processPayment(6).get();

    EXPECT_EQ(sixth.message, fallbackMessage());
    EXPECT_EQ(gateway_->callCount(), 5);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(orchestrator->circuitBreaker()->metrics().notPermittedCalls, 1u);
}

TEST_F(PaymentOrchestratorTest, OpenBreaker_RecoversAfterWait) {
    breakerConfig_.waitDurationInOpenState = 100ms;
    gateway_->failAlways();
    auto orchestrator = makeOrchestrator();

    for (int64_t id = 1; id <= 5; ++id) {
        orchestrator->processPayment(id).get();
    }
    ASSERT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::OPEN);

    std::this_thread::sleep_for(150ms);
    gateway_->approveAll();

    for (int64_t id = 10; id < 13; ++id) {
        EXPECT_TRUE(orchestrator->processPayment(id).get().success);
    }
    EXPECT_EQ(orchestrator->circuitBreaker()->state(), resilience::CircuitState::CLOSED);
}

TEST_F(PaymentOrchestratorTest, SharesBreakerThroughRegistry) {
    auto orchestrator = makeOrchestrator();

    EXPECT_EQ(registry_->find("payment-service"), orchestrator->circuitBreaker());
}
