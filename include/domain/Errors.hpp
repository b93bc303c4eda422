#pragma once

#include <stdexcept>
#include <string>

namespace ordercore::domain {

/**
 * @brief Ошибка валидации (пользователь, состояние ордера, переход статуса)
 *
 * Никогда не ретраится, отдаётся вызывающему синхронно.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

class OrderNotFoundError : public std::runtime_error {
public:
    explicit OrderNotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Сбой Order Store или Idempotency Ledger
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Конкурирующий владелец ключа не завершил создание за отведённое время
 */
class IdempotencyConflictError : public std::runtime_error {
public:
    explicit IdempotencyConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

class EventPublishError : public std::runtime_error {
public:
    explicit EventPublishError(const std::string& message)
        : std::runtime_error(message) {}
};

// ============================================
// ПЛАТЁЖНЫЙ ШЛЮЗ
// ============================================

/**
 * @brief Базовая ошибка платёжного шлюза
 *
 * Не ретраится, но учитывается circuit breaker'ом как отказ.
 */
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Транзиентный сбой (I/O, 5xx) - ретраится
 */
class GatewayTransientError : public GatewayError {
public:
    explicit GatewayTransientError(const std::string& message)
        : GatewayError(message) {}
};

/**
 * @brief Превышен дедлайн вызова - транзиентный сбой
 */
class GatewayTimeoutError : public GatewayTransientError {
public:
    explicit GatewayTimeoutError(const std::string& message)
        : GatewayTransientError(message) {}
};

/**
 * @brief Шлюз отверг запрос (4xx) - ошибка класса валидации
 *
 * Не ретраится и не учитывается circuit breaker'ом.
 */
class GatewayRejectedError : public GatewayError {
public:
    explicit GatewayRejectedError(const std::string& message)
        : GatewayError(message) {}
};

/**
 * @brief Circuit breaker не пропустил вызов
 */
class CallNotPermittedError : public std::runtime_error {
public:
    explicit CallNotPermittedError(const std::string& breakerName)
        : std::runtime_error("CircuitBreaker '" + breakerName + "' does not permit further calls") {}
};

/**
 * @brief Вызывающий отменил ожидание платежа
 */
class PaymentCancelledError : public std::runtime_error {
public:
    explicit PaymentCancelledError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ordercore::domain
