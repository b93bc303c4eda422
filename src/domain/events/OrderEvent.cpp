#include "domain/events/OrderEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>

namespace ordercore::domain {

OrderEvent::OrderEvent(OrderEventType type, const Order& order,
                       const std::optional<std::string>& key)
    : eventType(type)
    , orderId(order.id)
    , orderNumber(order.orderNumber)
    , userId(order.userId)
    , status(toString(order.status))
    , total(order.total)
    , idempotencyKey(key)
{
    eventId = utils::UuidGenerator::generate();
}

std::string OrderEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = toString(eventType);
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["orderNumber"] = orderNumber;
    j["userId"] = userId;
    j["status"] = status;
    j["total"] = {
        {"units", total.units},
        {"nano", total.nano},
        {"currency", total.currency}
    };
    j["idempotencyKey"] = idempotencyKey ? nlohmann::json(*idempotencyKey) : nlohmann::json(nullptr);
    if (metadata) {
        j["metadata"] = *metadata;
    }
    return j.dump();
}

OrderEvent OrderEvent::fromJson(const std::string& json) {
    auto j = nlohmann::json::parse(json);

    OrderEvent event;
    event.eventId = j.value("eventId", "");
    if (j.contains("timestamp")) {
        event.timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
    }
    event.eventType = parseOrderEventType(j.at("eventType").get<std::string>());
    event.orderId = j.value("orderId", int64_t{0});
    event.orderNumber = j.value("orderNumber", "");
    event.userId = j.value("userId", int64_t{0});
    event.status = j.value("status", "");

    if (j.contains("total")) {
        const auto& t = j["total"];
        event.total.units = t.value("units", int64_t{0});
        event.total.nano = t.value("nano", 0);
        event.total.currency = t.value("currency", "USD");
    }

    if (j.contains("idempotencyKey") && !j["idempotencyKey"].is_null()) {
        event.idempotencyKey = j["idempotencyKey"].get<std::string>();
    }
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        event.metadata = j["metadata"].get<std::string>();
    }
    return event;
}

} // namespace ordercore::domain
