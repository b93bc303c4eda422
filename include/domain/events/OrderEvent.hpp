#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include "domain/Order.hpp"
#include "domain/enums/OrderEventType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ordercore::domain {

/**
 * @brief Событие жизненного цикла заказа (топик order-events)
 *
 * status - статус на момент публикации. Ключ сообщения - orderId,
 * поэтому события одного заказа идут в одну партицию.
 */
struct OrderEvent : public DomainEvent {
    static constexpr const char* TOPIC = "order-events";

    OrderEventType eventType = OrderEventType::ORDER_CREATED;
    int64_t orderId = 0;
    std::string orderNumber;
    int64_t userId = 0;
    std::string status;
    Money total;
    std::optional<std::string> idempotencyKey;
    std::optional<std::string> metadata;

    OrderEvent() = default;

    /// Снимок заказа на момент события
    OrderEvent(OrderEventType type, const Order& order,
               const std::optional<std::string>& key = std::nullopt);

    /// Десериализация из сообщения Event Bus
    static OrderEvent fromJson(const std::string& json);

    std::string topic() const override { return TOPIC; }

    std::string key() const override { return std::to_string(orderId); }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderEvent>(*this);
    }
};

} // namespace ordercore::domain
