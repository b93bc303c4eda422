#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace ordercore::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Событие неизменяемо после публикации. topic() задаёт поток в Event Bus,
 * key() - ключ партиционирования (порядок гарантируется в пределах ключа).
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    virtual std::string topic() const = 0;

    virtual std::string key() const = 0;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace ordercore::domain
