#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/AccountType.hpp"
#include <string>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Событие: в плане счетов создан счёт
 */
struct AccountCreatedEvent : public DomainEvent {
    int64_t tenantId = 0;
    int64_t accountId = 0;
    int64_t detailedGroupId = 0;
    std::string accountCode;
    std::string accountName;
    AccountType accountType = AccountType::ASSET;
    bool isSystemAccount = false;

    AccountCreatedEvent() : DomainEvent("account.created") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<AccountCreatedEvent>(*this);
    }
};

} // namespace accounting::domain
