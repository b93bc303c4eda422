#pragma once

#include "domain/Errors.hpp"
#include <string>

namespace ordercore::domain {

enum class OrderStatus {
    PENDING,
    PAID,
    FAILED,
    CANCELLED,
    SHIPPED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::PAID: return "PAID";
        case OrderStatus::FAILED: return "FAILED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::SHIPPED: return "SHIPPED";
        default: return "UNKNOWN";
    }
}

inline OrderStatus parseOrderStatus(const std::string& str) {
    if (str == "PENDING") return OrderStatus::PENDING;
    if (str == "PAID") return OrderStatus::PAID;
    if (str == "FAILED") return OrderStatus::FAILED;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    if (str == "SHIPPED") return OrderStatus::SHIPPED;
    throw ValidationError("Unknown order status: " + str);
}

/**
 * @brief Допустимые переходы статуса
 *
 * PENDING -> PAID | FAILED | CANCELLED
 * FAILED  -> PAID (повторная оплата) | CANCELLED
 * PAID    -> SHIPPED
 * CANCELLED и SHIPPED - терминальные.
 */
inline bool canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::PAID || to == OrderStatus::FAILED || to == OrderStatus::CANCELLED;
        case OrderStatus::FAILED:
            return to == OrderStatus::PAID || to == OrderStatus::CANCELLED;
        case OrderStatus::PAID:
            return to == OrderStatus::SHIPPED;
        default:
            return false;
    }
}

} // namespace ordercore::domain
