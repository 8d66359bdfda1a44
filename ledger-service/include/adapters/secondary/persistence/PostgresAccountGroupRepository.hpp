#pragma once

#include "ports/output/IAccountGroupRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace accounting::adapters::secondary {

/**
 * @brief PostgreSQL repository для групп плана счетов
 *
 * Схема создаётся в db/schema.sql, не здесь.
 */
class PostgresAccountGroupRepository : public ports::output::IAccountGroupRepository {
public:
    explicit PostgresAccountGroupRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountGroupRepository] Initialized" << std::endl;
    }

    domain::AccountGroup insert(const domain::AccountGroup& group) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO account_groups "
                "(tenant_id, level, parent_id, kind, custom_name, code, description, is_active, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9)) "
                "RETURNING id",
                group.tenantId,
                domain::toString(group.level),
                group.parentId,
                domain::toString(group.kind),
                group.customName,
                group.code,
                group.description,
                group.isActive,
                group.createdAt.toUnixSeconds()
            );

            txn.commit();

            domain::AccountGroup saved = group;
            saved.id = result[0][0].as<int64_t>();
            return saved;
        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresAccountGroupRepository] insert duplicate: " << e.what() << std::endl;
            throw domain::DuplicateCodeError(group.code);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountGroupRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::AccountGroup> findById(int64_t tenantId, int64_t id) override {
        auto groups = query("findById", "WHERE tenant_id = $1 AND id = $2", tenantId, id);
        if (groups.empty()) return std::nullopt;
        return groups.front();
    }

    std::optional<domain::AccountGroup> findByCode(int64_t tenantId, const std::string& code) override {
        auto groups = query("findByCode", "WHERE tenant_id = $1 AND code = $2", tenantId, code);
        if (groups.empty()) return std::nullopt;
        return groups.front();
    }

    std::vector<domain::AccountGroup> findByLevel(int64_t tenantId, domain::GroupLevel level) override {
        return query("findByLevel", "WHERE tenant_id = $1 AND level = $2", tenantId, domain::toString(level));
    }

    std::vector<domain::AccountGroup> findChildren(int64_t tenantId, int64_t parentId) override {
        return query("findChildren", "WHERE tenant_id = $1 AND parent_id = $2", tenantId, parentId);
    }

    bool existsCode(int64_t tenantId, const std::string& code) override {
        return findByCode(tenantId, code).has_value();
    }

    bool deleteById(int64_t tenantId, int64_t id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "DELETE FROM account_groups WHERE tenant_id = $1 AND id = $2",
                tenantId, id
            );

            txn.commit();
            return result.affected_rows() > 0;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountGroupRepository] deleteById error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    /**
     * @brief SELECT по условию, в порядке создания
     */
    template <typename... Args>
    std::vector<domain::AccountGroup> query(const char* operation, const std::string& where, Args&&... args) {
        std::vector<domain::AccountGroup> groups;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, tenant_id, level, parent_id, kind, custom_name, code, description, is_active, "
                "       EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at "
                "FROM account_groups " + where + " ORDER BY id",
                std::forward<Args>(args)...
            );

            for (const auto& row : result) {
                groups.push_back(rowToGroup(row));
            }

            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountGroupRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
        return groups;
    }

    domain::AccountGroup rowToGroup(const pqxx::row& row) const {
        domain::AccountGroup group;
        group.id = row["id"].as<int64_t>();
        group.tenantId = row["tenant_id"].as<int64_t>();
        group.level = domain::groupLevelFromString(row["level"].as<std::string>());
        if (!row["parent_id"].is_null()) {
            group.parentId = row["parent_id"].as<int64_t>();
        }
        group.kind = domain::groupKindFromString(row["kind"].as<std::string>());
        group.customName = row["custom_name"].as<std::string>();
        group.code = row["code"].as<std::string>();
        group.description = row["description"].as<std::string>();
        group.isActive = row["is_active"].as<bool>();
        group.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
        return group;
    }
};

} // namespace accounting::adapters::secondary
