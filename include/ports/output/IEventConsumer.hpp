#pragma once

#include <string>
#include <vector>
#include <functional>

namespace ordercore::ports::output {

/**
 * @brief Тип обработчика событий
 *
 * @param topic Поток, из которого пришло событие
 * @param message JSON-сообщение с данными события
 */
using EventHandler = std::function<void(const std::string& topic, const std::string& message)>;

/**
 * @brief Интерфейс потребителя событий
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"order-events"},
 *     [this](const std::string& topic, const std::string& message) {
 *         handle(topic, message);
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    virtual void subscribe(const std::vector<std::string>& topics, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace ordercore::ports::output
