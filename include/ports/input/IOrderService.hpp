#pragma once

#include "domain/Order.hpp"
#include "domain/User.hpp"
#include "domain/PaymentResult.hpp"
#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace ordercore::ports::input {

/**
 * @brief Интерфейс сервиса заказов
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Создать заказ ровно один раз на ключ идемпотентности
     *
     * Повторный вызов с тем же живым ключом возвращает тот же заказ.
     *
     * @throws ValidationError невалидный пользователь или ключ
     * @throws PersistenceError сбой хранилища (без побочных эффектов)
     * @throws IdempotencyConflictError параллельный владелец ключа не успел
     */
    virtual domain::Order createOrder(
        const domain::User& user,
        const std::optional<std::string>& idempotencyKey) = 0;

    virtual std::optional<domain::Order> getOrder(int64_t orderId) = 0;

    virtual std::optional<domain::Order> getOrderByNumber(const std::string& orderNumber) = 0;

    virtual std::vector<domain::Order> getOrdersForUser(int64_t userId) = 0;

    /**
     * @brief Отразить итог оплаты в статусе заказа
     *
     * success: PENDING|FAILED -> PAID, иначе PENDING -> FAILED.
     */
    virtual domain::Order applyPaymentResult(int64_t orderId, const domain::PaymentResult& result) = 0;

    /**
     * @brief Отменить заказ (PENDING|FAILED -> CANCELLED)
     */
    virtual domain::Order cancelOrder(int64_t orderId) = 0;

    /**
     * @brief Отгрузить оплаченный заказ (PAID -> SHIPPED)
     */
    virtual domain::Order markShipped(int64_t orderId, const std::string& trackingNumber) = 0;
};

} // namespace ordercore::ports::input
