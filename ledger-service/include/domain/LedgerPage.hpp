#pragma once

#include "Account.hpp"
#include "JournalEntry.hpp"
#include "Money.hpp"
#include <vector>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Строка выписки по счёту с нарастающим остатком
 */
struct LedgerRow {
    AccountMovement movement;
    Money runningBalance;       ///< остаток после этой строки
};

/**
 * @brief Страница выписки по счёту
 */
struct LedgerPage {
    Account account;
    std::vector<LedgerRow> rows;
    Money openingBalance;       ///< начальный остаток счёта
    Money pageOpeningBalance;   ///< остаток перед первой строкой страницы
    Money runningBalance;       ///< остаток после последней строки страницы
    int64_t totalRows = 0;
    int page = 1;
    int pageSize = 0;
};

/**
 * @brief Строка оборотно-сальдовой ведомости
 */
struct TrialBalanceRow {
    int64_t accountId = 0;
    std::string accountCode;
    std::string accountName;
    AccountType accountType = AccountType::ASSET;
    Money debitBalance;
    Money creditBalance;
};

struct TrialBalance {
    std::vector<TrialBalanceRow> rows;
    Money totalDebit;
    Money totalCredit;

    bool isBalanced() const { return totalDebit == totalCredit; }
};

} // namespace accounting::domain
