#pragma once

#include "enums/InvoiceStatus.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <set>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Счёт-фактура в том виде, в каком его передаёт внешний модуль
 *
 * totalAmount = subtotal + taxAmount - |discountAmount|.
 */
struct Invoice {
    int64_t id = 0;
    int64_t tenantId = 0;
    std::string invoiceNumber;
    int64_t entityId = 0;
    std::string entityName;
    InvoiceStatus status = InvoiceStatus::DRAFT;
    Timestamp issueDate;
    Money subtotal;
    Money taxAmount;
    Money discountAmount;
    Money totalAmount;
    std::optional<int64_t> incomeAccountId;     ///< выбранный при утверждении счёт дохода
};

/**
 * @brief Поля счёта-фактуры, изменение которых влияет на проводку
 */
enum class InvoiceField {
    SUBTOTAL,
    TAX_AMOUNT,
    DISCOUNT_AMOUNT,
    TOTAL_AMOUNT,
    ISSUE_DATE,
    INVOICE_NUMBER,
    OTHER
};

using InvoiceChanges = std::set<InvoiceField>;

/**
 * @brief Затрагивают ли изменения суммы проводки
 */
inline bool affectsAmounts(const InvoiceChanges& changes) {
    return changes.count(InvoiceField::SUBTOTAL) > 0 ||
           changes.count(InvoiceField::TAX_AMOUNT) > 0 ||
           changes.count(InvoiceField::DISCOUNT_AMOUNT) > 0 ||
           changes.count(InvoiceField::TOTAL_AMOUNT) > 0;
}

} // namespace accounting::domain
