#pragma once

#include "domain/AccountGroup.hpp"
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::ports::output {

/**
 * @brief Репозиторий групп плана счетов
 *
 * Все методы ограничены tenantId.
 */
class IAccountGroupRepository {
public:
    virtual ~IAccountGroupRepository() = default;

    /**
     * @brief Сохранить новую группу, назначив id
     * @throws domain::DuplicateCodeError если code уже занят в tenant
     */
    virtual domain::AccountGroup insert(const domain::AccountGroup& group) = 0;

    virtual std::optional<domain::AccountGroup> findById(int64_t tenantId, int64_t id) = 0;

    virtual std::optional<domain::AccountGroup> findByCode(int64_t tenantId, const std::string& code) = 0;

    /**
     * @brief Все группы уровня, в порядке создания
     */
    virtual std::vector<domain::AccountGroup> findByLevel(int64_t tenantId, domain::GroupLevel level) = 0;

    /**
     * @brief Прямые потомки группы, в порядке создания
     */
    virtual std::vector<domain::AccountGroup> findChildren(int64_t tenantId, int64_t parentId) = 0;

    virtual bool existsCode(int64_t tenantId, const std::string& code) = 0;

    virtual bool deleteById(int64_t tenantId, int64_t id) = 0;
};

} // namespace accounting::ports::output
