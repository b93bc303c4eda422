#pragma once

#include "resilience/CircuitBreakerConfig.hpp"
#include "resilience/RetryPolicy.hpp"
#include <chrono>
#include <cstdlib>
#include <string>

namespace ordercore::settings {

/**
 * @brief Настройки устойчивости платёжного пути (payment-service)
 *
 * Читает из ENV:
 * - PAYMENT_CB_FAILURE_RATE_THRESHOLD (default: 50)
 * - PAYMENT_CB_SLIDING_WINDOW_SIZE (default: 10)
 * - PAYMENT_CB_MINIMUM_CALLS (default: 5)
 * - PAYMENT_CB_WAIT_DURATION_OPEN_MS (default: 30000)
 * - PAYMENT_CB_HALF_OPEN_CALLS (default: 3)
 * - PAYMENT_RETRY_MAX_ATTEMPTS (default: 3)
 * - PAYMENT_RETRY_WAIT_MS (default: 1000)
 * - PAYMENT_RETRY_BACKOFF_MULTIPLIER (default: 1.0)
 * - PAYMENT_TIMEOUT_MS (default: 5000)
 * - PAYMENT_EXECUTOR_THREADS (default: 4)
 * - PAYMENT_GATEWAY_THREADS (default: 8)
 */
class ResilienceSettings {
public:
    ResilienceSettings() {
        if (const char* val = std::getenv("PAYMENT_CB_FAILURE_RATE_THRESHOLD")) {
            breaker_.failureRateThreshold = std::stod(val);
        }
        if (const char* val = std::getenv("PAYMENT_CB_SLIDING_WINDOW_SIZE")) {
            breaker_.slidingWindowSize = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PAYMENT_CB_MINIMUM_CALLS")) {
            breaker_.minimumNumberOfCalls = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PAYMENT_CB_WAIT_DURATION_OPEN_MS")) {
            breaker_.waitDurationInOpenState = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("PAYMENT_CB_HALF_OPEN_CALLS")) {
            breaker_.permittedCallsInHalfOpenState = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PAYMENT_RETRY_MAX_ATTEMPTS")) {
            retry_.maxAttempts = std::stoi(val);
        }
        if (const char* val = std::getenv("PAYMENT_RETRY_WAIT_MS")) {
            retry_.waitDuration = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("PAYMENT_RETRY_BACKOFF_MULTIPLIER")) {
            retry_.backoffMultiplier = std::stod(val);
        }
        if (const char* val = std::getenv("PAYMENT_TIMEOUT_MS")) {
            timeout_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("PAYMENT_EXECUTOR_THREADS")) {
            executorThreads_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PAYMENT_GATEWAY_THREADS")) {
            gatewayThreads_ = static_cast<size_t>(std::stoul(val));
        }
    }

    /**
     * @brief Явные значения (тесты, локальный запуск)
     */
    static ResilienceSettings custom(const resilience::CircuitBreakerConfig& breaker,
                                     const resilience::RetryConfig& retry,
                                     std::chrono::milliseconds timeout,
                                     size_t executorThreads = 2,
                                     size_t gatewayThreads = 4) {
        ResilienceSettings s;
        s.breaker_ = breaker;
        s.retry_ = retry;
        s.timeout_ = timeout;
        s.executorThreads_ = executorThreads;
        s.gatewayThreads_ = gatewayThreads;
        return s;
    }

    std::string getServiceName() const { return serviceName_; }
    const resilience::CircuitBreakerConfig& getCircuitBreakerConfig() const { return breaker_; }
    const resilience::RetryConfig& getRetryConfig() const { return retry_; }
    std::chrono::milliseconds getTimeout() const { return timeout_; }
    size_t getExecutorThreads() const { return executorThreads_; }
    size_t getGatewayThreads() const { return gatewayThreads_; }

private:
    std::string serviceName_ = "payment-service";
    resilience::CircuitBreakerConfig breaker_;
    resilience::RetryConfig retry_;
    std::chrono::milliseconds timeout_{5000};
    size_t executorThreads_ = 4;
    size_t gatewayThreads_ = 8;
};

} // namespace ordercore::settings
