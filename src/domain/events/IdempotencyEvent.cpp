#include "domain/events/IdempotencyEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>

namespace ordercore::domain {

IdempotencyEvent::IdempotencyEvent(const std::string& key_, const std::string& type,
                                   const std::string& id, int64_t ttl)
    : idempotencyKey(key_)
    , resourceType(type)
    , resourceId(id)
    , ttlSeconds(ttl)
{
    eventId = utils::UuidGenerator::generate();
}

std::string IdempotencyEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["timestamp"] = timestamp.toString();
    j["idempotencyKey"] = idempotencyKey;
    j["resourceType"] = resourceType;
    j["resourceId"] = resourceId;
    j["ttlSeconds"] = ttlSeconds;
    return j.dump();
}

IdempotencyEvent IdempotencyEvent::fromJson(const std::string& json) {
    auto j = nlohmann::json::parse(json);

    IdempotencyEvent event;
    event.eventId = j.value("eventId", "");
    if (j.contains("timestamp")) {
        event.timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
    }
    event.idempotencyKey = j.value("idempotencyKey", "");
    event.resourceType = j.value("resourceType", "");
    event.resourceId = j.value("resourceId", "");
    event.ttlSeconds = j.value("ttlSeconds", int64_t{0});
    return event;
}

} // namespace ordercore::domain
