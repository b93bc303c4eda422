#pragma once

#include <string>

namespace ordercore::ports::output {

/**
 * @brief Интерфейс для публикации событий в Event Bus
 *
 * Реализуется RabbitMQAdapter и InMemoryEventBus.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие и дождаться подтверждения
     * @param topic Поток событий (например, "order-events")
     * @param key Ключ партиционирования
     * @param message JSON-сообщение
     * @throws EventPublishError если брокер не подтвердил запись
     */
    virtual void publish(const std::string& topic, const std::string& key, const std::string& message) = 0;
};

} // namespace ordercore::ports::output
