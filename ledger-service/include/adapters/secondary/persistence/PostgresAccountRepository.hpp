#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace accounting::adapters::secondary {

/**
 * @brief PostgreSQL repository для счетов
 *
 * Суммы хранятся в минорных единицах (BIGINT).
 * current_balance пишет только PostgresJournalRepository.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Initialized" << std::endl;
    }

    domain::Account insert(const domain::Account& account) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO accounts "
                "(tenant_id, detailed_group_id, account_code, account_name, description, account_type, "
                " entity_id, is_system_account, is_active, opening_balance, current_balance, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $10, to_timestamp($11)) "
                "RETURNING id",
                account.tenantId,
                account.detailedGroupId,
                account.accountCode,
                account.accountName,
                account.description,
                domain::toString(account.accountType),
                account.entityId,
                account.isSystemAccount,
                account.isActive,
                account.openingBalance.minor(),
                account.createdAt.toUnixSeconds()
            );

            txn.commit();

            domain::Account saved = account;
            saved.id = result[0][0].as<int64_t>();
            saved.currentBalance = saved.openingBalance;
            std::cout << "[PostgresAccountRepository] Saved account: " << saved.accountCode << std::endl;
            return saved;
        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresAccountRepository] insert duplicate: " << e.what() << std::endl;
            throw domain::DuplicateCodeError(account.accountCode);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void update(const domain::Account& account) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE accounts SET account_name = $1, description = $2, is_active = $3, entity_id = $4 "
                "WHERE tenant_id = $5 AND id = $6",
                account.accountName,
                account.description,
                account.isActive,
                account.entityId,
                account.tenantId,
                account.id
            );

            txn.commit();

            if (result.affected_rows() == 0) {
                throw domain::NotFoundError("Account", account.id);
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] update error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Account> findById(int64_t tenantId, int64_t id) override {
        auto accounts = query("findById", "WHERE tenant_id = $1 AND id = $2", tenantId, id);
        if (accounts.empty()) return std::nullopt;
        return accounts.front();
    }

    std::optional<domain::Account> findByCode(int64_t tenantId, const std::string& code) override {
        auto accounts = query("findByCode", "WHERE tenant_id = $1 AND account_code = $2", tenantId, code);
        if (accounts.empty()) return std::nullopt;
        return accounts.front();
    }

    std::vector<domain::Account> findByTenant(int64_t tenantId) override {
        return query("findByTenant", "WHERE tenant_id = $1", tenantId);
    }

    std::vector<domain::Account> findByType(int64_t tenantId, domain::AccountType type) override {
        return query("findByType", "WHERE tenant_id = $1 AND account_type = $2", tenantId, domain::toString(type));
    }

    std::vector<domain::Account> findByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) override {
        return query("findByDetailedGroup", "WHERE tenant_id = $1 AND detailed_group_id = $2",
                     tenantId, detailedGroupId);
    }

    size_t countByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COUNT(*) FROM accounts WHERE tenant_id = $1 AND detailed_group_id = $2",
                tenantId, detailedGroupId
            );

            txn.commit();
            return result[0][0].as<size_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] countByDetailedGroup error: " << e.what() << std::endl;
            throw;
        }
    }

    bool existsCode(int64_t tenantId, const std::string& code) override {
        return findByCode(tenantId, code).has_value();
    }

    bool deleteById(int64_t tenantId, int64_t id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "DELETE FROM accounts WHERE tenant_id = $1 AND id = $2",
                tenantId, id
            );

            txn.commit();
            return result.affected_rows() > 0;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] deleteById error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    template <typename... Args>
    std::vector<domain::Account> query(const char* operation, const std::string& where, Args&&... args) {
        std::vector<domain::Account> accounts;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, tenant_id, detailed_group_id, account_code, account_name, description, "
                "       account_type, entity_id, is_system_account, is_active, "
                "       opening_balance, current_balance, "
                "       EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at "
                "FROM accounts " + where + " ORDER BY account_code",
                std::forward<Args>(args)...
            );

            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
        return accounts;
    }

    domain::Account rowToAccount(const pqxx::row& row) const {
        domain::Account account;
        account.id = row["id"].as<int64_t>();
        account.tenantId = row["tenant_id"].as<int64_t>();
        account.detailedGroupId = row["detailed_group_id"].as<int64_t>();
        account.accountCode = row["account_code"].as<std::string>();
        account.accountName = row["account_name"].as<std::string>();
        account.description = row["description"].as<std::string>();
        account.accountType = domain::accountTypeFromString(row["account_type"].as<std::string>());
        if (!row["entity_id"].is_null()) {
            account.entityId = row["entity_id"].as<int64_t>();
        }
        account.isSystemAccount = row["is_system_account"].as<bool>();
        account.isActive = row["is_active"].as<bool>();
        account.openingBalance = domain::Money::fromMinor(row["opening_balance"].as<int64_t>());
        account.currentBalance = domain::Money::fromMinor(row["current_balance"].as<int64_t>());
        account.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
        return account;
    }
};

} // namespace accounting::adapters::secondary
