#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>
#include <memory>

namespace accounting::ports::output {

/**
 * @brief Callback для обработчиков событий
 */
using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port для публикации доменных событий ядра учёта.
 * Ядро только публикует; подписчики (уведомления, websocket)
 * регистрируются снаружи.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие
     *
     * @param event Доменное событие (копируется через clone())
     *
     * @note Доставка асинхронная: ошибки обработчиков не влияют на публикующего
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события (например, "journal.entry_posted")
     * @param handler Функция-обработчик
     *
     * @note Один eventType может иметь несколько handlers
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Отписаться от типа события
     *
     * @note Удаляет ВСЕ handlers для данного eventType
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    /**
     * @brief Проверить наличие подписчиков
     */
    virtual bool hasSubscribers(const std::string& eventType) const = 0;

    /**
     * @brief Запустить обработку событий (worker thread)
     */
    virtual void start() = 0;

    /**
     * @brief Остановить обработку событий
     *
     * @note Graceful shutdown: дожидается доставки уже опубликованных событий
     */
    virtual void stop() = 0;
};

} // namespace accounting::ports::output
