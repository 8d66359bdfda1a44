#pragma once

#include "domain/enums/GroupLevel.hpp"
#include "domain/enums/AccountType.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cctype>

namespace accounting::domain {

/**
 * @brief Предопределённые виды групп плана счетов
 *
 * Каждый вид (кроме CUSTOM) принадлежит ровно одному уровню.
 * CUSTOM допустим только на уровнях SUB_ELEMENT и DETAILED и
 * требует свободного имени customName.
 */
enum class GroupKind {
    // MainGroup
    BALANCE_SHEET,
    PROFIT_AND_LOSS,

    // ElementGroup
    ASSETS,
    LIABILITIES,
    EQUITY,
    INCOMES,
    EXPENSES,

    // SubElementGroup
    CAPITAL,
    SHARE_CAPITAL,
    RESERVES,
    NON_CURRENT_LIABILITIES,
    CURRENT_LIABILITIES,
    NON_CURRENT_ASSETS,
    CURRENT_ASSETS,
    SALES,
    SERVICE_REVENUE,
    COST_OF_SALES,
    COST_OF_SERVICE_REVENUE,
    PURCHASE_RETURNS,

    // DetailedGroup
    OWNERS_CAPITAL,
    LONG_TERM_LOANS,
    SHORT_TERM_LOANS,
    TRADE_CREDITORS,
    ACCRUED_CHARGES,
    OTHER_PAYABLES,
    PROPERTY_PLANT_EQUIPMENT,
    INTANGIBLE_ASSETS,
    STOCK_IN_TRADE,
    TRADE_DEBTORS,
    ADVANCES_PREPAYMENTS,
    OTHER_RECEIVABLES,
    CASH_BANK_BALANCES,

    CUSTOM
};

inline std::string toString(GroupKind kind) {
    switch (kind) {
        case GroupKind::BALANCE_SHEET:            return "balance_sheet";
        case GroupKind::PROFIT_AND_LOSS:          return "profit_and_loss";
        case GroupKind::ASSETS:                   return "assets";
        case GroupKind::LIABILITIES:              return "liabilities";
        case GroupKind::EQUITY:                   return "equity";
        case GroupKind::INCOMES:                  return "incomes";
        case GroupKind::EXPENSES:                 return "expenses";
        case GroupKind::CAPITAL:                  return "capital";
        case GroupKind::SHARE_CAPITAL:            return "share_capital";
        case GroupKind::RESERVES:                 return "reserves";
        case GroupKind::NON_CURRENT_LIABILITIES:  return "non_current_liabilities";
        case GroupKind::CURRENT_LIABILITIES:      return "current_liabilities";
        case GroupKind::NON_CURRENT_ASSETS:       return "non_current_assets";
        case GroupKind::CURRENT_ASSETS:           return "current_assets";
        case GroupKind::SALES:                    return "sales";
        case GroupKind::SERVICE_REVENUE:          return "service_revenue";
        case GroupKind::COST_OF_SALES:            return "cost_of_sales";
        case GroupKind::COST_OF_SERVICE_REVENUE:  return "cost_of_service_revenue";
        case GroupKind::PURCHASE_RETURNS:         return "purchase_returns";
        case GroupKind::OWNERS_CAPITAL:           return "owners_capital";
        case GroupKind::LONG_TERM_LOANS:          return "long_term_loans";
        case GroupKind::SHORT_TERM_LOANS:         return "short_term_loans";
        case GroupKind::TRADE_CREDITORS:          return "trade_creditors";
        case GroupKind::ACCRUED_CHARGES:          return "accrued_charges";
        case GroupKind::OTHER_PAYABLES:           return "other_payables";
        case GroupKind::PROPERTY_PLANT_EQUIPMENT: return "property_plant_equipment";
        case GroupKind::INTANGIBLE_ASSETS:        return "intangible_assets";
        case GroupKind::STOCK_IN_TRADE:           return "stock_in_trade";
        case GroupKind::TRADE_DEBTORS:            return "trade_debtors";
        case GroupKind::ADVANCES_PREPAYMENTS:     return "advances_prepayments";
        case GroupKind::OTHER_RECEIVABLES:        return "other_receivables";
        case GroupKind::CASH_BANK_BALANCES:       return "cash_bank_balances";
        case GroupKind::CUSTOM:                   return "custom";
    }
    return "unknown";
}

/**
 * @brief Разобрать имя вида (точное совпадение)
 * @return nullopt если имя не является предопределённым видом
 */
inline std::optional<GroupKind> tryGroupKindFromString(const std::string& str) {
    static const GroupKind all[] = {
        GroupKind::BALANCE_SHEET, GroupKind::PROFIT_AND_LOSS,
        GroupKind::ASSETS, GroupKind::LIABILITIES, GroupKind::EQUITY,
        GroupKind::INCOMES, GroupKind::EXPENSES,
        GroupKind::CAPITAL, GroupKind::SHARE_CAPITAL, GroupKind::RESERVES,
        GroupKind::NON_CURRENT_LIABILITIES, GroupKind::CURRENT_LIABILITIES,
        GroupKind::NON_CURRENT_ASSETS, GroupKind::CURRENT_ASSETS,
        GroupKind::SALES, GroupKind::SERVICE_REVENUE, GroupKind::COST_OF_SALES,
        GroupKind::COST_OF_SERVICE_REVENUE, GroupKind::PURCHASE_RETURNS,
        GroupKind::OWNERS_CAPITAL, GroupKind::LONG_TERM_LOANS,
        GroupKind::SHORT_TERM_LOANS, GroupKind::TRADE_CREDITORS,
        GroupKind::ACCRUED_CHARGES, GroupKind::OTHER_PAYABLES,
        GroupKind::PROPERTY_PLANT_EQUIPMENT, GroupKind::INTANGIBLE_ASSETS,
        GroupKind::STOCK_IN_TRADE, GroupKind::TRADE_DEBTORS,
        GroupKind::ADVANCES_PREPAYMENTS, GroupKind::OTHER_RECEIVABLES,
        GroupKind::CASH_BANK_BALANCES, GroupKind::CUSTOM
    };
    for (auto kind : all) {
        if (toString(kind) == str) {
            return kind;
        }
    }
    return std::nullopt;
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline GroupKind groupKindFromString(const std::string& str) {
    auto kind = tryGroupKindFromString(str);
    if (!kind) {
        throw std::invalid_argument("Unknown GroupKind: " + str);
    }
    return *kind;
}

/**
 * @brief Уровень, которому принадлежит предопределённый вид
 * @return nullopt для CUSTOM
 */
inline std::optional<GroupLevel> levelOf(GroupKind kind) {
    switch (kind) {
        case GroupKind::BALANCE_SHEET:
        case GroupKind::PROFIT_AND_LOSS:
            return GroupLevel::MAIN;

        case GroupKind::ASSETS:
        case GroupKind::LIABILITIES:
        case GroupKind::EQUITY:
        case GroupKind::INCOMES:
        case GroupKind::EXPENSES:
            return GroupLevel::ELEMENT;

        case GroupKind::CAPITAL:
        case GroupKind::SHARE_CAPITAL:
        case GroupKind::RESERVES:
        case GroupKind::NON_CURRENT_LIABILITIES:
        case GroupKind::CURRENT_LIABILITIES:
        case GroupKind::NON_CURRENT_ASSETS:
        case GroupKind::CURRENT_ASSETS:
        case GroupKind::SALES:
        case GroupKind::SERVICE_REVENUE:
        case GroupKind::COST_OF_SALES:
        case GroupKind::COST_OF_SERVICE_REVENUE:
        case GroupKind::PURCHASE_RETURNS:
            return GroupLevel::SUB_ELEMENT;

        case GroupKind::OWNERS_CAPITAL:
        case GroupKind::LONG_TERM_LOANS:
        case GroupKind::SHORT_TERM_LOANS:
        case GroupKind::TRADE_CREDITORS:
        case GroupKind::ACCRUED_CHARGES:
        case GroupKind::OTHER_PAYABLES:
        case GroupKind::PROPERTY_PLANT_EQUIPMENT:
        case GroupKind::INTANGIBLE_ASSETS:
        case GroupKind::STOCK_IN_TRADE:
        case GroupKind::TRADE_DEBTORS:
        case GroupKind::ADVANCES_PREPAYMENTS:
        case GroupKind::OTHER_RECEIVABLES:
        case GroupKind::CASH_BANK_BALANCES:
            return GroupLevel::DETAILED;

        case GroupKind::CUSTOM:
            return std::nullopt;
    }
    return std::nullopt;
}

/**
 * @brief Допустим ли вид на данном уровне
 */
inline bool isAllowedAt(GroupKind kind, GroupLevel level) {
    if (kind == GroupKind::CUSTOM) {
        return level == GroupLevel::SUB_ELEMENT || level == GroupLevel::DETAILED;
    }
    return levelOf(kind) == level;
}

/**
 * @brief Сокращение для стандартного кода группы ("CA" для current_assets)
 * @return пустая строка для CUSTOM
 */
inline std::string codeSuffix(GroupKind kind) {
    switch (kind) {
        case GroupKind::BALANCE_SHEET:            return "BS";
        case GroupKind::PROFIT_AND_LOSS:          return "PL";
        case GroupKind::ASSETS:                   return "A";
        case GroupKind::LIABILITIES:              return "L";
        case GroupKind::EQUITY:                   return "E";
        case GroupKind::INCOMES:                  return "I";
        case GroupKind::EXPENSES:                 return "E";
        case GroupKind::CAPITAL:                  return "C";
        case GroupKind::SHARE_CAPITAL:            return "SC";
        case GroupKind::RESERVES:                 return "R";
        case GroupKind::NON_CURRENT_LIABILITIES:  return "NCL";
        case GroupKind::CURRENT_LIABILITIES:      return "CL";
        case GroupKind::NON_CURRENT_ASSETS:       return "NCA";
        case GroupKind::CURRENT_ASSETS:           return "CA";
        case GroupKind::SALES:                    return "S";
        case GroupKind::SERVICE_REVENUE:          return "SR";
        case GroupKind::COST_OF_SALES:            return "COS";
        case GroupKind::COST_OF_SERVICE_REVENUE:  return "COSR";
        case GroupKind::PURCHASE_RETURNS:         return "PR";
        case GroupKind::OWNERS_CAPITAL:           return "OC";
        case GroupKind::LONG_TERM_LOANS:          return "LTL";
        case GroupKind::SHORT_TERM_LOANS:         return "STL";
        case GroupKind::TRADE_CREDITORS:          return "TC";
        case GroupKind::ACCRUED_CHARGES:          return "AC";
        case GroupKind::OTHER_PAYABLES:           return "OP";
        case GroupKind::PROPERTY_PLANT_EQUIPMENT: return "PPE";
        case GroupKind::INTANGIBLE_ASSETS:        return "IA";
        case GroupKind::STOCK_IN_TRADE:           return "SIT";
        case GroupKind::TRADE_DEBTORS:            return "TD";
        case GroupKind::ADVANCES_PREPAYMENTS:     return "AP";
        case GroupKind::OTHER_RECEIVABLES:        return "OR";
        case GroupKind::CASH_BANK_BALANCES:       return "CB";
        case GroupKind::CUSTOM:                   return "";
    }
    return "";
}

/**
 * @brief Человекочитаемое имя ("Current Assets")
 */
inline std::string displayName(GroupKind kind) {
    std::string name = toString(kind);
    bool upper = true;
    for (auto& c : name) {
        if (c == '_') {
            c = ' ';
            upper = true;
        } else if (upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upper = false;
        }
    }
    return name;
}

/**
 * @brief MainGroup, под которым обязан стоять вид ElementGroup
 */
inline std::optional<GroupKind> requiredMainGroup(GroupKind elementKind) {
    switch (elementKind) {
        case GroupKind::ASSETS:
        case GroupKind::LIABILITIES:
        case GroupKind::EQUITY:
            return GroupKind::BALANCE_SHEET;
        case GroupKind::INCOMES:
        case GroupKind::EXPENSES:
            return GroupKind::PROFIT_AND_LOSS;
        default:
            return std::nullopt;
    }
}

/**
 * @brief Тип счетов, выводимый из вида ElementGroup
 */
inline std::optional<AccountType> accountTypeFor(GroupKind elementKind) {
    switch (elementKind) {
        case GroupKind::ASSETS:      return AccountType::ASSET;
        case GroupKind::LIABILITIES: return AccountType::LIABILITY;
        case GroupKind::EQUITY:      return AccountType::EQUITY;
        case GroupKind::INCOMES:     return AccountType::REVENUE;
        case GroupKind::EXPENSES:    return AccountType::EXPENSE;
        default:                     return std::nullopt;
    }
}

} // namespace accounting::domain
