#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace accounting::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Ядро учёта публикует события в IEventBus после успешной записи;
 * подписчики (уведомления, websocket) получают их асинхронно.
 */
struct DomainEvent {
    std::string eventId;        ///< уникальный id события ("evt-...")
    std::string eventType;      ///< тип события (account.created, journal.entry_posted)
    Timestamp timestamp;        ///< время создания события

    DomainEvent() : eventId(nextEventId()), timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventId(nextEventId()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;

    /**
     * @brief Сгенерировать id события: "evt-{unix millis}-{random hex}"
     */
    static std::string nextEventId();
};

} // namespace accounting::domain
