#pragma once

#include "Account.hpp"
#include "enums/PaymentMethod.hpp"
#include "errors/LedgerErrors.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Семантическая роль счёта в проводке
 */
enum class RoleKind {
    ENTITY_RECEIVABLE,
    INCOME,
    TAX_PAYABLE,
    DISCOUNT_ALLOWED,
    CASH_OR_BANK
};

inline std::string toString(RoleKind kind) {
    switch (kind) {
        case RoleKind::ENTITY_RECEIVABLE: return "entity_receivable";
        case RoleKind::INCOME:            return "income";
        case RoleKind::TAX_PAYABLE:       return "tax_payable";
        case RoleKind::DISCOUNT_ALLOWED:  return "discount_allowed";
        case RoleKind::CASH_OR_BANK:      return "cash_or_bank";
    }
    return "unknown";
}

/**
 * @brief Описание роли вместе с контекстом поиска
 */
struct AccountRole {
    RoleKind kind = RoleKind::INCOME;
    int64_t entityId = 0;                       ///< ENTITY_RECEIVABLE
    std::string entityName;                     ///< ENTITY_RECEIVABLE
    std::optional<int64_t> selectedAccountId;   ///< INCOME
    PaymentMethod paymentMethod = PaymentMethod::BANK_TRANSFER;  ///< CASH_OR_BANK

    static AccountRole entityReceivable(int64_t entityId, const std::string& entityName) {
        AccountRole role;
        role.kind = RoleKind::ENTITY_RECEIVABLE;
        role.entityId = entityId;
        role.entityName = entityName;
        return role;
    }

    static AccountRole income(std::optional<int64_t> selectedAccountId) {
        AccountRole role;
        role.kind = RoleKind::INCOME;
        role.selectedAccountId = selectedAccountId;
        return role;
    }

    static AccountRole taxPayable() {
        AccountRole role;
        role.kind = RoleKind::TAX_PAYABLE;
        return role;
    }

    static AccountRole discountAllowed() {
        AccountRole role;
        role.kind = RoleKind::DISCOUNT_ALLOWED;
        return role;
    }

    static AccountRole cashOrBank(PaymentMethod method) {
        AccountRole role;
        role.kind = RoleKind::CASH_OR_BANK;
        role.paymentMethod = method;
        return role;
    }
};

/**
 * @brief Что создать, если подходящего счёта нет
 */
struct ProvisioningPlan {
    int64_t detailedGroupId = 0;
    std::string groupCode;
    std::string accountName;
    std::string accountCode;
    std::string description;
    std::optional<int64_t> entityId;
    bool isSystemAccount = false;
    std::string strategy;               ///< какая стратегия нашла группу
};

/**
 * @brief Результат первой фазы разрешения роли
 *
 * Ровно одно из трёх: существующий счёт, план создания или пробел.
 */
struct ResolutionPlan {
    AccountRole role;
    std::optional<Account> existing;
    std::optional<ProvisioningPlan> provision;
    std::optional<MissingAccount> gap;

    bool isResolved() const { return existing.has_value(); }
    bool needsProvisioning() const { return provision.has_value(); }
    bool isMissing() const { return gap.has_value(); }
};

} // namespace accounting::domain
