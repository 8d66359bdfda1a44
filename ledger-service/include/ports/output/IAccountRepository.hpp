#pragma once

#include "domain/Account.hpp"
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::ports::output {

/**
 * @brief Репозиторий счетов
 *
 * currentBalance здесь не изменяется: его пересчитывает
 * IJournalRepository в той же транзакции, что и запись строк.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Сохранить новый счёт (currentBalance = openingBalance)
     * @throws domain::DuplicateCodeError если accountCode уже занят в tenant
     */
    virtual domain::Account insert(const domain::Account& account) = 0;

    /**
     * @brief Обновить имя, описание, активность и привязку к клиенту
     */
    virtual void update(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findById(int64_t tenantId, int64_t id) = 0;

    virtual std::optional<domain::Account> findByCode(int64_t tenantId, const std::string& code) = 0;

    /**
     * @brief Все счета tenant, упорядоченные по коду
     */
    virtual std::vector<domain::Account> findByTenant(int64_t tenantId) = 0;

    virtual std::vector<domain::Account> findByType(int64_t tenantId, domain::AccountType type) = 0;

    virtual std::vector<domain::Account> findByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) = 0;

    virtual size_t countByDetailedGroup(int64_t tenantId, int64_t detailedGroupId) = 0;

    virtual bool existsCode(int64_t tenantId, const std::string& code) = 0;

    virtual bool deleteById(int64_t tenantId, int64_t id) = 0;
};

} // namespace accounting::ports::output
