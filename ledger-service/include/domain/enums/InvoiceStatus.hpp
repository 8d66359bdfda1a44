#pragma once

#include <string>
#include <stdexcept>

namespace accounting::domain {

/**
 * @brief Статус счёта-фактуры (владелец сущности внешний, ядро читает статус)
 */
enum class InvoiceStatus {
    DRAFT,
    APPROVED,
    SENT,
    PAID,
    PARTIALLY_PAID,
    OVERDUE,
    CANCELED,
    VOID
};

inline std::string toString(InvoiceStatus status) {
    switch (status) {
        case InvoiceStatus::DRAFT:          return "draft";
        case InvoiceStatus::APPROVED:       return "approved";
        case InvoiceStatus::SENT:           return "sent";
        case InvoiceStatus::PAID:           return "paid";
        case InvoiceStatus::PARTIALLY_PAID: return "partially_paid";
        case InvoiceStatus::OVERDUE:        return "overdue";
        case InvoiceStatus::CANCELED:       return "canceled";
        case InvoiceStatus::VOID:           return "void";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline InvoiceStatus invoiceStatusFromString(const std::string& str) {
    if (str == "draft")          return InvoiceStatus::DRAFT;
    if (str == "approved")       return InvoiceStatus::APPROVED;
    if (str == "sent")           return InvoiceStatus::SENT;
    if (str == "paid")           return InvoiceStatus::PAID;
    if (str == "partially_paid") return InvoiceStatus::PARTIALLY_PAID;
    if (str == "overdue")        return InvoiceStatus::OVERDUE;
    if (str == "canceled")       return InvoiceStatus::CANCELED;
    if (str == "void")           return InvoiceStatus::VOID;
    throw std::invalid_argument("Unknown InvoiceStatus: " + str);
}

/**
 * @brief Разрешён ли переход статуса
 *
 * Возврат в DRAFT разрешён из любого статуса (редактирование
 * переоткрывает счёт). Переход в тот же статус не считается переходом,
 * кроме APPROVED → APPROVED (повторное утверждение после правки).
 */
inline bool canTransition(InvoiceStatus from, InvoiceStatus to) {
    if (to == InvoiceStatus::DRAFT) {
        return true;
    }

    switch (from) {
        case InvoiceStatus::DRAFT:
            return to == InvoiceStatus::APPROVED || to == InvoiceStatus::SENT ||
                   to == InvoiceStatus::CANCELED || to == InvoiceStatus::VOID;

        case InvoiceStatus::APPROVED:
            return to == InvoiceStatus::APPROVED || to == InvoiceStatus::SENT ||
                   to == InvoiceStatus::PAID || to == InvoiceStatus::PARTIALLY_PAID ||
                   to == InvoiceStatus::OVERDUE || to == InvoiceStatus::CANCELED ||
                   to == InvoiceStatus::VOID;

        case InvoiceStatus::SENT:
            return to == InvoiceStatus::APPROVED || to == InvoiceStatus::PAID ||
                   to == InvoiceStatus::PARTIALLY_PAID || to == InvoiceStatus::OVERDUE ||
                   to == InvoiceStatus::CANCELED || to == InvoiceStatus::VOID;

        case InvoiceStatus::PARTIALLY_PAID:
            return to == InvoiceStatus::PAID || to == InvoiceStatus::OVERDUE ||
                   to == InvoiceStatus::VOID;

        case InvoiceStatus::OVERDUE:
            return to == InvoiceStatus::PAID || to == InvoiceStatus::PARTIALLY_PAID ||
                   to == InvoiceStatus::VOID;

        case InvoiceStatus::PAID:
            return to == InvoiceStatus::VOID;

        case InvoiceStatus::CANCELED:
        case InvoiceStatus::VOID:
            return false;
    }
    return false;
}

} // namespace accounting::domain
