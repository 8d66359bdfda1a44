#pragma once

#include "ports/input/ILedgerQueryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "utils/Strings.hpp"
#include <memory>
#include <iostream>
#include <algorithm>

namespace accounting::application {

/**
 * @brief Выписки по счетам и оборотно-сальдовая ведомость
 *
 * Только чтение. Нарастающий остаток считается от openingBalance по всем
 * движениям счёта, затем из результата вырезается страница.
 */
class LedgerQueryService : public ports::input::ILedgerQueryService {
public:
    LedgerQueryService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::IJournalRepository> journalRepository,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accountRepository_(std::move(accountRepository))
      , journalRepository_(std::move(journalRepository))
      , settings_(std::move(settings))
    {
        std::cout << "[LedgerQueryService] Created" << std::endl;
    }

    domain::LedgerPage getLedger(int64_t tenantId, int64_t accountId, int page, int pageSize) override {
        if (page < 1) {
            throw domain::ValidationError("Page must be >= 1, got " + std::to_string(page));
        }
        if (pageSize <= 0) {
            pageSize = settings_->getDefaultPageSize();
        }
        pageSize = std::min(pageSize, settings_->getMaxPageSize());

        auto account = accountRepository_->findById(tenantId, accountId);
        if (!account) {
            throw domain::NotFoundError("Account", accountId);
        }

        auto movements = journalRepository_->findMovements(tenantId, accountId);

        domain::LedgerPage result;
        result.account = *account;
        result.openingBalance = account->openingBalance;
        result.totalRows = static_cast<int64_t>(movements.size());
        result.page = page;
        result.pageSize = pageSize;

        size_t first = static_cast<size_t>(page - 1) * static_cast<size_t>(pageSize);
        size_t last = first + static_cast<size_t>(pageSize);

        domain::Money running = account->openingBalance;
        result.pageOpeningBalance = running;
        for (size_t i = 0; i < movements.size() && i < last; ++i) {
            if (i == first) {
                result.pageOpeningBalance = running;
            }
            running += domain::signedMovement(
                account->accountType, movements[i].debitAmount, movements[i].creditAmount);
            if (i >= first) {
                result.rows.push_back({movements[i], running});
            }
        }

        // Страница за пределами выписки: остаток на конец всех движений
        if (first >= movements.size()) {
            result.pageOpeningBalance = running;
        }
        result.runningBalance = running;
        return result;
    }

    std::vector<domain::Account> listAccounts(int64_t tenantId, const domain::AccountFilter& filter) override {
        std::vector<domain::Account> result;
        for (auto& account : accountRepository_->findByTenant(tenantId)) {
            if (filter.accountType && account.accountType != *filter.accountType) continue;
            if (filter.detailedGroupId && account.detailedGroupId != *filter.detailedGroupId) continue;
            if (filter.isActive && account.isActive != *filter.isActive) continue;
            if (!filter.includeSystemAccounts && account.isSystemAccount) continue;
            if (!filter.nameContains.empty() &&
                !utils::Strings::containsIgnoreCase(account.accountName, filter.nameContains)) {
                continue;
            }
            result.push_back(std::move(account));
        }
        return result;
    }

    domain::TrialBalance getTrialBalance(int64_t tenantId) override {
        domain::TrialBalance result;
        for (const auto& account : accountRepository_->findByTenant(tenantId)) {
            domain::TrialBalanceRow row;
            row.accountId = account.id;
            row.accountCode = account.accountCode;
            row.accountName = account.accountName;
            row.accountType = account.accountType;

            const auto& balance = account.currentBalance;
            bool debitSide = domain::isDebitNormal(account.accountType) != balance.isNegative();
            if (debitSide) {
                row.debitBalance = balance.abs();
            } else {
                row.creditBalance = balance.abs();
            }

            result.totalDebit += row.debitBalance;
            result.totalCredit += row.creditBalance;
            result.rows.push_back(std::move(row));
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace accounting::application
