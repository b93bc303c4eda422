#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "Errors.hpp"
#include "enums/OrderStatus.hpp"
#include <string>
#include <cstdint>

namespace ordercore::domain {

/**
 * @brief Заказ (одна транзакция checkout)
 *
 * id и createdAt/updatedAt проставляет хранилище.
 * orderNumber генерируется при создании и больше не меняется.
 * Физически заказы не удаляются: отмена - это статус.
 */
class Order {
public:
    int64_t id = 0;
    std::string orderNumber;
    int64_t userId = 0;
    OrderStatus status = OrderStatus::PENDING;
    Money subtotal;
    Money shipping;
    Money tax;
    Money total;
    std::string paymentId;
    std::string trackingNumber;
    std::string pendingReason;
    Timestamp createdAt;
    Timestamp updatedAt;

    Order() = default;

    Order(const std::string& number, int64_t user)
        : orderNumber(number)
        , userId(user)
        , status(OrderStatus::PENDING)
        , createdAt(Timestamp::now())
        , updatedAt(Timestamp::now())
    {}

    bool isPersisted() const { return id > 0; }

    bool isPaid() const {
        return status == OrderStatus::PAID || status == OrderStatus::SHIPPED;
    }

    /**
     * @brief Перевести заказ в новый статус
     * @throws ValidationError если переход запрещён
     */
    void transitionTo(OrderStatus next) {
        if (!canTransition(status, next)) {
            throw ValidationError("Order " + orderNumber + ": illegal transition " +
                                  toString(status) + " -> " + toString(next));
        }
        status = next;
        updatedAt = Timestamp::now();
    }

    /**
     * @brief Установить суммы, total = subtotal + shipping + tax
     * @throws ValidationError на отрицательных суммах
     */
    void setAmounts(const Money& subtotal_, const Money& shipping_, const Money& tax_) {
        if (subtotal_.isNegative() || shipping_.isNegative() || tax_.isNegative()) {
            throw ValidationError("Order amounts must be non-negative");
        }
        subtotal = subtotal_;
        shipping = shipping_;
        tax = tax_;
        total = subtotal_ + shipping_ + tax_;
        updatedAt = Timestamp::now();
    }
};

} // namespace ordercore::domain
