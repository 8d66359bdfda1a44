#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>
#include <algorithm>

namespace accounting::adapters::secondary {

/**
 * @brief In-memory реализация репозитория счетов
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    explicit InMemoryAccountRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    domain::Account insert(const domain::Account& account) override {
        auto guard = store_->lock();

        for (const auto& [id, existing] : store_->accounts) {
            if (existing.tenantId == account.tenantId && existing.accountCode == account.accountCode) {
                throw domain::DuplicateCodeError(account.accountCode);
            }
        }

        domain::Account saved = account;
        saved.id = store_->nextAccountId++;
        saved.currentBalance = saved.openingBalance;
        store_->accounts[saved.id] = saved;
        return saved;
    }

    void update(const domain::Account& account) override {
        auto guard = store_->lock();
        auto it = store_->accounts.find(account.id);
        if (it == store_->accounts.end() || it->second.tenantId != account.tenantId) {
            throw domain::NotFoundError("Account", account.id);
        }
        it->second.accountName = account.accountName;
        it->second.description = account.description;
        it->second.isActive = account.isActive;
        it->second.entityId = account.entityId;
    }

    std::optional<domain::Account> findById(int64_t tenantId, int64_t id) override {
        auto guard = store_->lock();
        auto it = store_->accounts.find(id);
        if (it == store_->accounts.end() || it->second.tenantId != tenantId) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::Account> findByCode(int64_t tenantId, const std::string& code) override {
        auto guard = store_->lock();
        for (const auto& [id, account] : store_->accounts) {
            if (account.tenantId == tenantId && account.accountCode == code) {
                return account;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::Account> findByTenant(int64_t tenantId) override {
        return select(tenantId, [](const domain::Account&) { return true; });
    }

    std::vector<domain::Account> findByType(int64_t tenantId, domain::AccountType type) override {
        return select(tenantId, [type](const domain::Account& a) { return a.accountType == type; });
    }

    std::vector<domain::Account> findByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) override {
        return select(tenantId, [detailedGroupId](const domain::Account& a) {
            return a.detailedGroupId == detailedGroupId;
        });
    }

    size_t countByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) override {
        return findByDetailedGroup(tenantId, detailedGroupId).size();
    }

    bool existsCode(int64_t tenantId, const std::string& code) override {
        return findByCode(tenantId, code).has_value();
    }

    bool deleteById(int64_t tenantId, int64_t id) override {
        auto guard = store_->lock();
        auto it = store_->accounts.find(id);
        if (it == store_->accounts.end() || it->second.tenantId != tenantId) {
            return false;
        }
        store_->accounts.erase(it);
        return true;
    }

    size_t size() const {
        auto guard = store_->lock();
        return store_->accounts.size();
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;

    template<typename Predicate>
    std::vector<domain::Account> select(int64_t tenantId, Predicate predicate) {
        auto guard = store_->lock();
        std::vector<domain::Account> result;
        for (const auto& [id, account] : store_->accounts) {
            if (account.tenantId == tenantId && predicate(account)) {
                result.push_back(account);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Account& a, const domain::Account& b) {
                return a.accountCode < b.accountCode;
            });
        return result;
    }
};

} // namespace accounting::adapters::secondary
