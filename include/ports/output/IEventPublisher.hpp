#pragma once

#include <string>

namespace treasury::ports::output {

/**
 * @brief Интерфейс для публикации событий (append-only журнал аудита)
 *
 * Реализуется RabbitMQAdapter и InMemoryEventBus.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "vault.deposited")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace treasury::ports::output
