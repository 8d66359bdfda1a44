#pragma once

#include "domain/AccountGroup.hpp"
#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Запрос на создание группы
 */
struct CreateGroupRequest {
    int64_t tenantId = 0;
    domain::GroupLevel level = domain::GroupLevel::MAIN;
    std::optional<int64_t> parentId;
    domain::GroupKind kind = domain::GroupKind::CUSTOM;
    std::string customName;         ///< обязательно для CUSTOM
    std::string description;
};

/**
 * @brief Итог seedStandardChart
 */
struct SeedSummary {
    size_t groupsCreated = 0;
    size_t accountsCreated = 0;
};

/**
 * @brief Интерфейс сервиса плана счетов
 *
 * Input Port для структурных операций над иерархией
 * MainGroup → ElementGroup → SubElementGroup → DetailedGroup → Account.
 */
class IChartOfAccountsService {
public:
    virtual ~IChartOfAccountsService() = default;

    /**
     * @brief Создать группу
     *
     * @throws domain::ValidationError неверный уровень, вид или пустое имя CUSTOM
     * @throws domain::NotFoundError родитель не найден
     * @throws domain::DuplicateCodeError стандартный код уже занят
     */
    virtual domain::AccountGroup createGroup(const CreateGroupRequest& request) = 0;

    /**
     * @brief Удалить группу
     *
     * @throws domain::ConstraintError есть дочерние группы или счета
     */
    virtual void deleteGroup(int64_t tenantId, int64_t groupId) = 0;

    virtual std::optional<domain::AccountGroup> getGroup(int64_t tenantId, int64_t groupId) = 0;

    /**
     * @brief Группы уровня; при заданном parentId только его потомки
     */
    virtual std::vector<domain::AccountGroup> listGroups(
        int64_t tenantId,
        domain::GroupLevel level,
        std::optional<int64_t> parentId = std::nullopt
    ) = 0;

    /**
     * @brief Предки DetailedGroup от MainGroup
     *
     * @throws domain::NotFoundError / domain::ValidationError
     */
    virtual domain::GroupPath getGroupPath(int64_t tenantId, int64_t detailedGroupId) = 0;

    /**
     * @brief Создать счёт в DetailedGroup
     *
     * Тип счёта выводится из ElementGroup-предка. Код, если не задан явно:
     * "{element}.{subElement}.{detailed}.{NNN}".
     *
     * @note Публикует AccountCreatedEvent
     */
    virtual domain::Account createAccount(
        int64_t tenantId,
        int64_t detailedGroupId,
        const std::string& accountName,
        const domain::Money& openingBalance,
        const domain::AccountOptions& options = {}
    ) = 0;

    /**
     * @throws domain::SystemAccountProtectionError системный счёт
     * @throws domain::ConstraintError на счёт ссылаются строки проводок
     */
    virtual void deleteAccount(int64_t tenantId, int64_t accountId) = 0;

    /**
     * @throws domain::SystemAccountProtectionError системный счёт
     */
    virtual domain::Account renameAccount(int64_t tenantId, int64_t accountId, const std::string& accountName) = 0;

    virtual domain::Account setAccountActive(int64_t tenantId, int64_t accountId, bool isActive) = 0;

    virtual std::optional<domain::Account> getAccount(int64_t tenantId, int64_t accountId) = 0;

    virtual std::optional<domain::Account> findAccountByCode(int64_t tenantId, const std::string& code) = 0;

    /**
     * @brief Создать стандартное дерево и базовые системные счета
     *
     * Идемпотентно: существующие узлы и счета не дублируются.
     */
    virtual SeedSummary seedStandardChart(int64_t tenantId) = 0;
};

} // namespace accounting::ports::input
