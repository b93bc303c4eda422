#include "application/PaymentOrchestrator.hpp"
#include "domain/Errors.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <functional>
#include <iostream>
#include <thread>

namespace ordercore::application {

PaymentOrchestrator::PaymentOrchestrator(
    std::shared_ptr<ports::output::IPaymentGateway> gateway,
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
    settings::ResilienceSettings settings)
    : gateway_(std::move(gateway))
    , breakers_(std::move(breakers))
    , breaker_(breakers_->circuitBreaker(settings.getServiceName(), settings.getCircuitBreakerConfig()))
    , retry_(settings.getRetryConfig())
    , timeLimiter_(std::make_unique<resilience::TimeLimiter>(settings.getTimeout(), settings.getGatewayThreads()))
    , executor_(std::max<size_t>(1, settings.getExecutorThreads()))
{
    std::cout << "[PaymentOrchestrator] Created: breaker=" << breaker_->name()
              << " attempts=" << retry_.maxAttempts()
              << " timeout=" << settings.getTimeout().count() << "ms" << std::endl;
}

PaymentOrchestrator::~PaymentOrchestrator() {
    executor_.join();
}

domain::PaymentTask PaymentOrchestrator::processPayment(int64_t orderId) {
    // Поздние продолжения тоже идут на executor, а не на поток вызывающего
    auto state = domain::PaymentTask::makeState([this](std::function<void()> job) {
        boost::asio::post(executor_, std::move(job));
    });

    if (orderId <= 0) {
        state->complete(domain::PaymentResult::failed("invalid order id"));
        return domain::PaymentTask(state);
    }

    boost::asio::post(executor_, [this, state, orderId]() { run(state, orderId); });
    return domain::PaymentTask(state);
}

void PaymentOrchestrator::run(const std::shared_ptr<domain::PaymentTask::State>& state, int64_t orderId) {
    try {
        state->complete(executeWithResilience(orderId, *state));
    } catch (const domain::PaymentCancelledError& e) {
        std::cout << "[PaymentOrchestrator] " << e.what() << std::endl;
        state->fail(std::current_exception());
    } catch (const std::exception& e) {
        std::cerr << "[PaymentOrchestrator] Unexpected error for order " << orderId
                  << ": " << e.what() << ", using fallback" << std::endl;
        state->complete(domain::PaymentResult::fallback());
    }
}

domain::PaymentResult PaymentOrchestrator::executeWithResilience(
    int64_t orderId, const domain::PaymentTask::State& state)
{
    for (int attempt = 1;; ++attempt) {
        throwIfCancelled(orderId, state);

        auto permit = breaker_->tryAcquirePermission();
        if (!permit) {
            std::cout << "[PaymentOrchestrator] " << domain::CallNotPermittedError(breaker_->name()).what()
                      << ", fallback for order " << orderId << std::endl;
            return domain::PaymentResult::fallback();
        }

        try {
            auto gateway = gateway_;
            auto response = timeLimiter_->execute<domain::GatewayResponse>(
                [gateway, orderId]() { return gateway->capture(orderId); });
            breaker_->onSuccess(*permit);

            if (response.approved) {
                std::cout << "[PaymentOrchestrator] Order " << orderId
                          << " paid: txn=" << response.transactionId << std::endl;
                return domain::PaymentResult::ok(response.transactionId);
            }

            std::cout << "[PaymentOrchestrator] Order " << orderId
                      << " declined: " << response.declineReason << std::endl;
            return domain::PaymentResult::failed(
                response.declineReason.empty() ? "payment declined" : response.declineReason);

        } catch (const domain::GatewayRejectedError& e) {
            breaker_->onIgnored(*permit);
            std::cerr << "[PaymentOrchestrator] Order " << orderId << " rejected: " << e.what() << std::endl;
            return domain::PaymentResult::failed(std::string("payment rejected: ") + e.what());

        } catch (const std::exception& e) {
            breaker_->onError(*permit);

            if (!retry_.shouldRetry(attempt, e)) {
                std::cerr << "[PaymentOrchestrator] Order " << orderId << " attempt " << attempt
                          << "/" << retry_.maxAttempts() << " failed: " << e.what()
                          << ", using fallback" << std::endl;
                return domain::PaymentResult::fallback();
            }

            std::cerr << "[PaymentOrchestrator] Order " << orderId << " attempt " << attempt
                      << "/" << retry_.maxAttempts() << " failed: " << e.what()
                      << ", retrying" << std::endl;
        }

        waitBackoff(retry_.backoffAfter(attempt), state);
    }
}

void PaymentOrchestrator::waitBackoff(std::chrono::milliseconds duration,
                                      const domain::PaymentTask::State& state) const
{
    const auto slice = std::chrono::milliseconds(10);
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (!state.isCancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
}

void PaymentOrchestrator::throwIfCancelled(int64_t orderId, const domain::PaymentTask::State& state) {
    if (state.isCancelled()) {
        throw domain::PaymentCancelledError("Payment for order " + std::to_string(orderId) + " cancelled");
    }
}

} // namespace ordercore::application
