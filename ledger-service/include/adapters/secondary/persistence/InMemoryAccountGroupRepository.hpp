#pragma once

#include "ports/output/IAccountGroupRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <memory>

namespace accounting::adapters::secondary {

/**
 * @brief In-memory реализация репозитория групп
 */
class InMemoryAccountGroupRepository : public ports::output::IAccountGroupRepository {
public:
    explicit InMemoryAccountGroupRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    domain::AccountGroup insert(const domain::AccountGroup& group) override {
        auto guard = store_->lock();

        for (const auto& [id, existing] : store_->groups) {
            if (existing.tenantId == group.tenantId && existing.code == group.code) {
                throw domain::DuplicateCodeError(group.code);
            }
        }

        domain::AccountGroup saved = group;
        saved.id = store_->nextGroupId++;
        store_->groups[saved.id] = saved;
        return saved;
    }

    std::optional<domain::AccountGroup> findById(int64_t tenantId, int64_t id) override {
        auto guard = store_->lock();
        auto it = store_->groups.find(id);
        if (it == store_->groups.end() || it->second.tenantId != tenantId) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::AccountGroup> findByCode(int64_t tenantId, const std::string& code) override {
        auto guard = store_->lock();
        for (const auto& [id, group] : store_->groups) {
            if (group.tenantId == tenantId && group.code == code) {
                return group;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::AccountGroup> findByLevel(int64_t tenantId, domain::GroupLevel level) override {
        auto guard = store_->lock();
        std::vector<domain::AccountGroup> result;
        for (const auto& [id, group] : store_->groups) {
            if (group.tenantId == tenantId && group.level == level) {
                result.push_back(group);
            }
        }
        return result;
    }

    std::vector<domain::AccountGroup> findChildren(int64_t tenantId, int64_t parentId) override {
        auto guard = store_->lock();
        std::vector<domain::AccountGroup> result;
        for (const auto& [id, group] : store_->groups) {
            if (group.tenantId == tenantId && group.parentId == parentId) {
                result.push_back(group);
            }
        }
        return result;
    }

    bool existsCode(int64_t tenantId, const std::string& code) override {
        return findByCode(tenantId, code).has_value();
    }

    bool deleteById(int64_t tenantId, int64_t id) override {
        auto guard = store_->lock();
        auto it = store_->groups.find(id);
        if (it == store_->groups.end() || it->second.tenantId != tenantId) {
            return false;
        }
        store_->groups.erase(it);
        return true;
    }

    size_t size() const {
        auto guard = store_->lock();
        return store_->groups.size();
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace accounting::adapters::secondary
