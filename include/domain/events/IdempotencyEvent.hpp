#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace ordercore::domain {

/**
 * @brief Регистрация ключа идемпотентности (топик idempotency-keys)
 *
 * Retention топика (24ч) настраивается на стороне брокера.
 */
struct IdempotencyEvent : public DomainEvent {
    static constexpr const char* TOPIC = "idempotency-keys";

    std::string idempotencyKey;
    std::string resourceType;
    std::string resourceId;
    int64_t ttlSeconds = 0;

    IdempotencyEvent() = default;

    IdempotencyEvent(const std::string& key_, const std::string& type,
                     const std::string& id, int64_t ttl);

    static IdempotencyEvent fromJson(const std::string& json);

    std::string topic() const override { return TOPIC; }

    std::string key() const override { return idempotencyKey; }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<IdempotencyEvent>(*this);
    }
};

} // namespace ordercore::domain
