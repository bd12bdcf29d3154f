#pragma once

#include "domain/Amount.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace treasury::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Пишутся в append-only журнал аудита через IEventPublisher.
 * eventType служит routing key.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (vault.deposited, strategy.capital_deployed)
    UnixSeconds occurredAt = 0; ///< Время по доменным часам

    explicit DomainEvent(const std::string& type)
        : eventId(utils::UuidGenerator::generate()), eventType(type) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;

protected:
    /// Общие поля конверта
    nlohmann::json envelope() const;
};

} // namespace treasury::domain
