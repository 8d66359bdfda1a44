#pragma once

#include "domain/Money.hpp"
#include <string>
#include <stdexcept>

namespace accounting::domain {

/**
 * @brief Тип счёта в плане счетов
 *
 * Никогда не задаётся напрямую: выводится из ElementGroup-предка.
 */
enum class AccountType {
    ASSET,
    LIABILITY,
    EQUITY,
    REVENUE,
    EXPENSE
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "asset";
        case AccountType::LIABILITY: return "liability";
        case AccountType::EQUITY:    return "equity";
        case AccountType::REVENUE:   return "revenue";
        case AccountType::EXPENSE:   return "expense";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "asset")     return AccountType::ASSET;
    if (str == "liability") return AccountType::LIABILITY;
    if (str == "equity")    return AccountType::EQUITY;
    if (str == "revenue")   return AccountType::REVENUE;
    if (str == "expense")   return AccountType::EXPENSE;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

/**
 * @brief Растёт ли счёт по дебету (активы и расходы)
 */
inline bool isDebitNormal(AccountType type) {
    switch (type) {
        case AccountType::ASSET:
        case AccountType::EXPENSE:
            return true;
        case AccountType::LIABILITY:
        case AccountType::EQUITY:
        case AccountType::REVENUE:
            return false;
    }
    return true;
}

/**
 * @brief Изменение остатка счёта от одной строки проводки
 */
inline Money signedMovement(AccountType type, const Money& debit, const Money& credit) {
    return isDebitNormal(type) ? debit - credit : credit - debit;
}

} // namespace accounting::domain
