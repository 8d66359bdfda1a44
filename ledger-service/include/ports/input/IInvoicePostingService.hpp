#pragma once

#include "domain/Invoice.hpp"
#include "domain/Payment.hpp"
#include "domain/JournalEntry.hpp"
#include <optional>
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Проекция жизненного цикла счёта-фактуры в проводки
 *
 * Для каждого документа-источника существует не более одной проводки:
 * повторное утверждение заменяет строки существующей.
 */
class IInvoicePostingService {
public:
    virtual ~IInvoicePostingService() = default;

    /**
     * @brief Утверждение счёта-фактуры
     *
     * @param invoice Счёт в текущем (до утверждения) статусе
     * @param selectedIncomeAccountId Выбранный пользователем счёт дохода
     *
     * @throws domain::ValidationError переход статуса запрещён
     * @throws domain::MissingAccountError со списком всех недостающих счетов
     */
    virtual domain::JournalEntry onInvoiceApproved(
        const domain::Invoice& invoice,
        std::optional<int64_t> selectedIncomeAccountId
    ) = 0;

    /**
     * @brief Правка счёта, связанного с проводкой
     *
     * @return Обновлённая проводка или nullopt, если суммы не менялись
     *         или проводки нет
     */
    virtual std::optional<domain::JournalEntry> onInvoiceEdited(
        const domain::Invoice& invoice,
        const domain::InvoiceChanges& changedFields
    ) = 0;

    /**
     * @brief Возврат в черновик: помечает описание проводки
     */
    virtual std::optional<domain::JournalEntry> onInvoiceRevertedToDraft(const domain::Invoice& invoice) = 0;

    /**
     * @brief Поступление оплаты: Дт касса/банк, Кт дебиторка клиента
     */
    virtual domain::JournalEntry onPaymentRecorded(
        const domain::Invoice& invoice,
        const domain::Payment& payment
    ) = 0;
};

} // namespace accounting::ports::input
