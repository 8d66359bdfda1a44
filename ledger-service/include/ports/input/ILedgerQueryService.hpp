#pragma once

#include "domain/LedgerPage.hpp"
#include "domain/Account.hpp"
#include <vector>
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Чтение учётных данных для отчётов
 */
class ILedgerQueryService {
public:
    virtual ~ILedgerQueryService() = default;

    /**
     * @brief Страница выписки по счёту с нарастающим остатком
     *
     * @param page Номер страницы, с 1
     * @param pageSize Размер страницы (0 = по умолчанию, ограничен максимумом)
     *
     * @throws domain::NotFoundError счёт не найден
     * @throws domain::ValidationError page < 1
     */
    virtual domain::LedgerPage getLedger(int64_t tenantId, int64_t accountId, int page, int pageSize) = 0;

    virtual std::vector<domain::Account> listAccounts(int64_t tenantId, const domain::AccountFilter& filter = {}) = 0;

    virtual domain::TrialBalance getTrialBalance(int64_t tenantId) = 0;
};

} // namespace accounting::ports::input
