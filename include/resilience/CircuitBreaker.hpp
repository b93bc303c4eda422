#pragma once

#include "resilience/CircuitBreakerConfig.hpp"
#include "resilience/CircuitState.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ordercore::resilience {

/**
 * @brief Источник монотонного времени (подменяется в тестах)
 */
using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

inline TimeSource steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

/**
 * @brief Снимок метрик breaker'а
 */
struct CircuitBreakerMetrics {
    CircuitState state = CircuitState::CLOSED;
    double failureRate = -1.0;          ///< -1, пока в окне меньше minimumNumberOfCalls
    size_t bufferedCalls = 0;
    size_t failedCalls = 0;
    uint64_t notPermittedCalls = 0;
};

/**
 * @brief Circuit breaker со скользящим окном по количеству вызовов
 *
 * CLOSED -> OPEN: в окне >= minimumNumberOfCalls и доля отказов >= порога.
 * OPEN -> HALF_OPEN: прошло waitDurationInOpenState (проверяется лениво).
 * HALF_OPEN -> CLOSED: permittedCallsInHalfOpenState подряд успешных проб.
 * HALF_OPEN -> OPEN: любой отказ пробы.
 *
 * Все переходы под одним мьютексом. Результат вызова записывается вместе
 * с Permit, выданным при входе: результаты из предыдущего поколения
 * (до смены состояния) отбрасываются, чтобы запоздавший вызов не сдвинул
 * новое окно.
 */
class CircuitBreaker {
public:
    struct Permit {
        uint64_t generation;
        CircuitState state;
    };

    using StateListener = std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    CircuitBreaker(std::string name, CircuitBreakerConfig config, TimeSource clock = steadyClock());

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

    /**
     * @brief Разрешение на вызов
     * @return std::nullopt - вызов отклонён (OPEN или нет слотов HALF_OPEN)
     */
    std::optional<Permit> tryAcquirePermission();

    void onSuccess(const Permit& permit);
    void onError(const Permit& permit);

    /**
     * @brief Вызов завершён результатом, который не считается ни успехом, ни отказом
     *
     * Освобождает слот HALF_OPEN, окно не меняется.
     */
    void onIgnored(const Permit& permit);

    CircuitState state();
    CircuitBreakerMetrics metrics();

    void transitionToOpen();
    void reset();

    void setStateListener(StateListener listener);

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    void record(const Permit& permit, bool failed);
    void releaseHalfOpenSlot(const Permit& permit);

    // Вызываются под mutex_
    void refreshLocked(std::vector<Transition>& transitions);
    void transitionLocked(CircuitState to, std::vector<Transition>& transitions);
    double failureRateLocked() const;
    size_t failedCallsLocked() const;

    void notify(const std::vector<Transition>& transitions);

    std::string name_;
    CircuitBreakerConfig config_;
    TimeSource clock_;

    std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint64_t generation_ = 0;
    std::deque<bool> window_;   // true = отказ
    std::chrono::steady_clock::time_point openedAt_{};
    size_t halfOpenInFlight_ = 0;
    size_t halfOpenSuccesses_ = 0;
    uint64_t notPermitted_ = 0;
    StateListener listener_;
};

} // namespace ordercore::resilience
