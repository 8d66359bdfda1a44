#pragma once

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Отложенная единица работы
 *
 * Команды складываются в ThreadSafeQueue и исполняются воркером
 * в отдельном потоке (доставка доменных событий подписчикам).
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::exception если команду невозможно выполнить
     */
    virtual void execute() = 0;

    /**
     * @brief Короткое имя команды для логов
     */
    virtual const char* name() const = 0;
};
