#pragma once

#include <chrono>
#include <cstddef>

namespace ordercore::resilience {

/**
 * @brief Параметры circuit breaker
 *
 * Значения по умолчанию совпадают с боевой конфигурацией payment-service:
 * 50% отказов в окне из 10 вызовов, минимум 5 вызовов, 30с в OPEN,
 * 3 пробных вызова в HALF_OPEN.
 */
struct CircuitBreakerConfig {
    double failureRateThreshold = 50.0;                         ///< Процент отказов для OPEN
    size_t slidingWindowSize = 10;                              ///< Размер окна (последние N вызовов)
    size_t minimumNumberOfCalls = 5;                            ///< До этого числа доля не оценивается
    std::chrono::milliseconds waitDurationInOpenState{30000};   ///< Cool-down до HALF_OPEN
    size_t permittedCallsInHalfOpenState = 3;                   ///< Подряд успешных проб для CLOSED
};

} // namespace ordercore::resilience
