#pragma once

#include "domain/JournalEntry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Интерфейс движка проводок
 *
 * Input Port для атомарного создания, замены и удаления проводок
 * с проверкой баланса и пересчётом остатков счетов.
 */
class IJournalEntryService {
public:
    virtual ~IJournalEntryService() = default;

    /**
     * @brief Создать проводку
     *
     * @throws domain::ValidationError нет строк или отрицательная сумма
     * @throws domain::NotFoundError счёт строки не найден
     * @throws domain::UnbalancedEntryError дебет != кредит
     * @throws domain::DuplicateSourceDocumentError источник уже связан
     *
     * @note Публикует JournalEntryPostedEvent
     */
    virtual domain::JournalEntry createEntry(
        const domain::JournalEntryHeader& header,
        const std::vector<domain::JournalLineInput>& lines
    ) = 0;

    /**
     * @brief Заменить строки проводки на месте
     *
     * @note Публикует JournalEntryReplacedEvent
     */
    virtual domain::JournalEntry replaceLines(
        int64_t tenantId,
        int64_t entryId,
        const std::vector<domain::JournalLineInput>& lines,
        const std::optional<domain::JournalHeaderUpdate>& headerUpdate = std::nullopt
    ) = 0;

    /**
     * @brief Изменить признак проведения
     *
     * @note setPosted(false) только меняет признак: остатки не сторнируются
     * @throws domain::ValidationError проведение проводки без строк
     */
    virtual domain::JournalEntry setPosted(
        int64_t tenantId,
        int64_t entryId,
        bool isPosted,
        const std::string& updatedBy = ""
    ) = 0;

    /**
     * @brief Изменить поля заголовка без замены строк
     *
     * @note Смена isPosted через этот метод подчиняется тем же правилам, что setPosted
     */
    virtual domain::JournalEntry updateHeader(
        int64_t tenantId,
        int64_t entryId,
        const domain::JournalHeaderUpdate& update
    ) = 0;

    /**
     * @brief Удалить проводку со всеми строками (вне зависимости от статуса)
     *
     * @note Публикует JournalEntryDeletedEvent
     */
    virtual void deleteEntry(int64_t tenantId, int64_t entryId) = 0;

    virtual std::optional<domain::JournalEntry> getEntry(int64_t tenantId, int64_t entryId) = 0;

    virtual std::vector<domain::JournalEntryLine> getLines(int64_t tenantId, int64_t entryId) = 0;

    virtual std::optional<domain::JournalEntry> findBySource(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) = 0;

    virtual std::vector<domain::JournalEntry> listEntries(
        int64_t tenantId,
        const domain::JournalEntryFilter& filter = {}
    ) = 0;
};

} // namespace accounting::ports::input
