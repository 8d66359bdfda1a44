#pragma once

#include "domain/enums/GroupKind.hpp"
#include <string>
#include <vector>

namespace accounting::application {

/**
 * @brief Узел стандартного дерева плана счетов
 */
struct StandardGroup {
    domain::GroupKind kind;
    std::string customName;                 ///< для CUSTOM
    std::vector<StandardGroup> children;
};

/**
 * @brief Базовый системный счёт стандартного плана
 */
struct StandardAccount {
    std::string code;
    std::string name;
    std::string description;
    std::vector<std::string> path;          ///< имена групп от MainGroup до DetailedGroup
};

/**
 * @brief Стандартный план счетов, создаваемый seedStandardChart
 */
class StandardChart {
public:
    static const std::vector<StandardGroup>& groups() {
        using K = domain::GroupKind;
        static const std::vector<StandardGroup> tree = {
            {K::BALANCE_SHEET, "", {
                {K::ASSETS, "", {
                    {K::NON_CURRENT_ASSETS, "", {
                        {K::PROPERTY_PLANT_EQUIPMENT, "", {}},
                        {K::INTANGIBLE_ASSETS, "", {}},
                    }},
                    {K::CURRENT_ASSETS, "", {
                        {K::STOCK_IN_TRADE, "", {}},
                        {K::TRADE_DEBTORS, "", {}},
                        {K::ADVANCES_PREPAYMENTS, "", {}},
                        {K::OTHER_RECEIVABLES, "", {}},
                        {K::CASH_BANK_BALANCES, "", {}},
                    }},
                }},
                {K::LIABILITIES, "", {
                    {K::NON_CURRENT_LIABILITIES, "", {
                        {K::LONG_TERM_LOANS, "", {}},
                    }},
                    {K::CURRENT_LIABILITIES, "", {
                        {K::SHORT_TERM_LOANS, "", {}},
                        {K::TRADE_CREDITORS, "", {}},
                        {K::ACCRUED_CHARGES, "", {}},
                        {K::OTHER_PAYABLES, "", {}},
                    }},
                }},
                {K::EQUITY, "", {
                    {K::CAPITAL, "", {
                        {K::OWNERS_CAPITAL, "", {}},
                    }},
                    {K::SHARE_CAPITAL, "", {}},
                    {K::RESERVES, "", {}},
                }},
            }},
            {K::PROFIT_AND_LOSS, "", {
                {K::INCOMES, "", {
                    {K::SALES, "", {
                        {K::CUSTOM, "Sales", {}},
                    }},
                    {K::SERVICE_REVENUE, "", {
                        {K::CUSTOM, "Service Revenue", {}},
                    }},
                }},
                {K::EXPENSES, "", {
                    {K::COST_OF_SALES, "", {
                        {K::CUSTOM, "Cost of Sales", {}},
                    }},
                    {K::COST_OF_SERVICE_REVENUE, "", {
                        {K::CUSTOM, "Cost of Service Revenue", {}},
                    }},
                    {K::PURCHASE_RETURNS, "", {}},
                }},
            }},
        };
        return tree;
    }

    static const std::vector<StandardAccount>& accounts() {
        static const std::vector<StandardAccount> list = {
            {"1100", "Bank", "Main bank account",
                {"balance_sheet", "assets", "current_assets", "cash_bank_balances"}},
            {"1110", "Cash", "Cash on hand",
                {"balance_sheet", "assets", "current_assets", "cash_bank_balances"}},
            {"1200", "Trade Debtors", "Amounts owed by customers for goods or services",
                {"balance_sheet", "assets", "current_assets", "trade_debtors"}},
            {"2200", "Tax Liability", "Taxes collected and owed to the authorities",
                {"balance_sheet", "liabilities", "current_liabilities", "accrued_charges"}},
            {"4000", "Service Revenue", "Income from services provided",
                {"profit_and_loss", "incomes", "service_revenue", "Service Revenue"}},
        };
        return list;
    }
};

} // namespace accounting::application
