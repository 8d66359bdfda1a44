#pragma once

#include "domain/AccountGroup.hpp"
#include "domain/Account.hpp"
#include "domain/JournalEntry.hpp"
#include <map>
#include <set>
#include <vector>
#include <mutex>
#include <cstdint>

namespace accounting::adapters::secondary {

/**
 * @brief Общее in-memory хранилище плана счетов и проводок
 *
 * Один мьютекс на всё хранилище: запись строк проводки и пересчёт
 * остатков счетов выполняются под одним захватом, как одна транзакция.
 * Репозитории держат shared_ptr на общий экземпляр.
 */
class InMemoryLedgerStore {
public:
    std::unique_lock<std::mutex> lock() const {
        return std::unique_lock<std::mutex>(mutex_);
    }

    // Данные доступны только под lock()
    std::map<int64_t, domain::AccountGroup> groups;
    std::map<int64_t, domain::Account> accounts;
    std::map<int64_t, domain::JournalEntry> entries;
    std::map<int64_t, std::vector<domain::JournalEntryLine>> lines;   ///< entryId -> строки

    int64_t nextGroupId = 1;
    int64_t nextAccountId = 1;
    int64_t nextEntryId = 1;
    int64_t nextLineId = 1;

    /**
     * @brief Пересчитать currentBalance счёта по всем строкам
     * @note Вызывать под lock()
     */
    void recomputeBalance(int64_t tenantId, int64_t accountId) {
        auto it = accounts.find(accountId);
        if (it == accounts.end() || it->second.tenantId != tenantId) {
            return;
        }

        domain::Account& account = it->second;
        domain::Money balance = account.openingBalance;
        for (const auto& [entryId, entryLines] : lines) {
            auto entry = entries.find(entryId);
            if (entry == entries.end() || entry->second.tenantId != tenantId) {
                continue;
            }
            for (const auto& line : entryLines) {
                if (line.accountId == accountId) {
                    balance += domain::signedMovement(account.accountType, line.debitAmount, line.creditAmount);
                }
            }
        }
        account.currentBalance = balance;
    }

    /**
     * @brief Очистить хранилище (для тестов)
     */
    void clear() {
        auto guard = lock();
        groups.clear();
        accounts.clear();
        entries.clear();
        lines.clear();
        nextGroupId = nextAccountId = nextEntryId = nextLineId = 1;
    }

private:
    mutable std::mutex mutex_;
};

} // namespace accounting::adapters::secondary
