#pragma once

#include "ports/input/IPaymentService.hpp"
#include "ports/output/IPaymentGateway.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "resilience/RetryPolicy.hpp"
#include "resilience/TimeLimiter.hpp"
#include "settings/ResilienceSettings.hpp"
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>

namespace ordercore::application {

/**
 * @brief Оркестратор оплаты: breaker + retry + timeout + fallback вокруг шлюза
 *
 * Порядок обёрток на каждую попытку, снаружи внутрь:
 * Retry -> CircuitBreaker -> TimeLimiter -> IPaymentGateway::capture.
 *
 * Каждая попытка - один вызов для breaker'а. Отказ breaker'а завершает
 * ретраи сразу и возвращает fallback. Работа идёт на ограниченном пуле
 * потоков, processPayment возвращает PaymentTask немедленно.
 * Продолжения PaymentTask::then всегда выполняются на этом же пуле,
 * даже если задача завершилась до вызова then.
 */
class PaymentOrchestrator : public ports::input::IPaymentService {
public:
    PaymentOrchestrator(
        std::shared_ptr<ports::output::IPaymentGateway> gateway,
        std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
        settings::ResilienceSettings settings);

    ~PaymentOrchestrator() override;

    PaymentOrchestrator(const PaymentOrchestrator&) = delete;
    PaymentOrchestrator& operator=(const PaymentOrchestrator&) = delete;

    domain::PaymentTask processPayment(int64_t orderId) override;

    std::shared_ptr<resilience::CircuitBreaker> circuitBreaker() const { return breaker_; }

private:
    void run(const std::shared_ptr<domain::PaymentTask::State>& state, int64_t orderId);

    domain::PaymentResult executeWithResilience(int64_t orderId, const domain::PaymentTask::State& state);

    void waitBackoff(std::chrono::milliseconds duration, const domain::PaymentTask::State& state) const;

    static void throwIfCancelled(int64_t orderId, const domain::PaymentTask::State& state);

    // Порядок полей важен: пулы останавливаются раньше, чем умирает шлюз
    std::shared_ptr<ports::output::IPaymentGateway> gateway_;
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
    std::shared_ptr<resilience::CircuitBreaker> breaker_;
    resilience::RetryPolicy retry_;
    std::unique_ptr<resilience::TimeLimiter> timeLimiter_;
    boost::asio::thread_pool executor_;
};

} // namespace ordercore::application
