#pragma once

#include "domain/Errors.hpp"
#include <string>

namespace ordercore::domain {

enum class OrderEventType {
    ORDER_CREATED,
    ORDER_UPDATED,
    ORDER_CANCELLED,
    ORDER_PAID,
    ORDER_PAYMENT_FAILED,
    ORDER_SHIPPED,
    ORDER_DELIVERED
};

inline std::string toString(OrderEventType type) {
    switch (type) {
        case OrderEventType::ORDER_CREATED: return "ORDER_CREATED";
        case OrderEventType::ORDER_UPDATED: return "ORDER_UPDATED";
        case OrderEventType::ORDER_CANCELLED: return "ORDER_CANCELLED";
        case OrderEventType::ORDER_PAID: return "ORDER_PAID";
        case OrderEventType::ORDER_PAYMENT_FAILED: return "ORDER_PAYMENT_FAILED";
        case OrderEventType::ORDER_SHIPPED: return "ORDER_SHIPPED";
        case OrderEventType::ORDER_DELIVERED: return "ORDER_DELIVERED";
        default: return "UNKNOWN";
    }
}

inline OrderEventType parseOrderEventType(const std::string& str) {
    if (str == "ORDER_CREATED") return OrderEventType::ORDER_CREATED;
    if (str == "ORDER_UPDATED") return OrderEventType::ORDER_UPDATED;
    if (str == "ORDER_CANCELLED") return OrderEventType::ORDER_CANCELLED;
    if (str == "ORDER_PAID") return OrderEventType::ORDER_PAID;
    if (str == "ORDER_PAYMENT_FAILED") return OrderEventType::ORDER_PAYMENT_FAILED;
    if (str == "ORDER_SHIPPED") return OrderEventType::ORDER_SHIPPED;
    if (str == "ORDER_DELIVERED") return OrderEventType::ORDER_DELIVERED;
    throw ValidationError("Unknown order event type: " + str);
}

} // namespace ordercore::domain
