#pragma once

#include "domain/AccountRole.hpp"
#include "domain/Account.hpp"
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Разрешение семантической роли в конкретный счёт
 *
 * Двухфазное: plan() ничего не пишет, materialize() создаёт счёт по плану.
 * Это позволяет вызывающему собрать все пробелы до первой записи.
 */
class IAccountResolver {
public:
    virtual ~IAccountResolver() = default;

    /**
     * @brief Найти счёт роли или подготовить план его создания
     *
     * Неверно выбранный счёт дохода возвращается как пробел (gap),
     * а не исключение, чтобы вызывающий собрал все пробелы сразу.
     */
    virtual domain::ResolutionPlan plan(int64_t tenantId, const domain::AccountRole& role) = 0;

    /**
     * @brief Получить счёт по плану (создать при необходимости)
     *
     * @throws domain::MissingAccountError если план содержит пробел
     */
    virtual domain::Account materialize(int64_t tenantId, const domain::ResolutionPlan& plan) = 0;

    /**
     * @brief plan() + materialize()
     */
    virtual domain::Account resolve(int64_t tenantId, const domain::AccountRole& role) = 0;
};

} // namespace accounting::ports::input
