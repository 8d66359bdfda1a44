#pragma once

#include "enums/AccountType.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Счёт плана счетов (лист иерархии)
 *
 * Принадлежит ровно одной DetailedGroup. accountType выводится из
 * ElementGroup-предка при создании и больше не меняется.
 * currentBalance кэширует openingBalance плюс знаковую сумму движений
 * по всем строкам проводок.
 */
struct Account {
    int64_t id = 0;
    int64_t tenantId = 0;
    int64_t detailedGroupId = 0;
    std::string accountCode;            ///< уникален в пределах tenant
    std::string accountName;
    std::string description;
    AccountType accountType = AccountType::ASSET;
    std::optional<int64_t> entityId;    ///< привязка дебиторского счёта к клиенту
    bool isSystemAccount = false;       ///< защищён от переименования и удаления
    bool isActive = true;
    Money openingBalance;
    Money currentBalance;
    Timestamp createdAt;
};

/**
 * @brief Дополнительные параметры createAccount
 */
struct AccountOptions {
    std::optional<std::string> accountCode;     ///< явный код вместо сгенерированного
    std::string description;
    std::optional<int64_t> entityId;
    bool isSystemAccount = false;
};

/**
 * @brief Фильтр listAccounts
 */
struct AccountFilter {
    std::optional<AccountType> accountType;
    std::optional<int64_t> detailedGroupId;
    std::optional<bool> isActive;
    std::string nameContains;                   ///< без учёта регистра, пустая строка = без фильтра
    bool includeSystemAccounts = true;
};

} // namespace accounting::domain
