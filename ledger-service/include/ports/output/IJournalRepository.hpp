#pragma once

#include "domain/JournalEntry.hpp"
#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace accounting::ports::output {

/**
 * @brief Репозиторий проводок
 *
 * Операции create / replaceLines / remove атомарны: заголовок, строки и
 * пересчёт currentBalance всех затронутых счетов либо применяются целиком,
 * либо не применяются вовсе.
 *
 * Пересчёт: currentBalance = openingBalance + Σ знаковых движений по всем
 * строкам счёта (независимо от isPosted).
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    /**
     * @brief Создать проводку со строками
     *
     * @return Проводка с назначенным id
     * @throws domain::DuplicateSourceDocumentError если источник уже связан с проводкой
     */
    virtual domain::JournalEntry create(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) = 0;

    /**
     * @brief Заменить строки проводки и обновить заголовок
     *
     * @return id счетов старых и новых строк (без повторов)
     * @throws domain::NotFoundError если проводки нет
     */
    virtual std::vector<int64_t> replaceLines(
        const domain::JournalEntry& entry,
        const std::vector<domain::JournalEntryLine>& lines
    ) = 0;

    /**
     * @brief Обновить только заголовок (статус, описание)
     */
    virtual void updateHeader(const domain::JournalEntry& entry) = 0;

    /**
     * @brief Удалить проводку вместе со строками
     *
     * @return id счетов удалённых строк; пусто, если проводки не было
     */
    virtual std::vector<int64_t> remove(int64_t tenantId, int64_t entryId) = 0;

    virtual std::optional<domain::JournalEntry> findById(int64_t tenantId, int64_t entryId) = 0;

    virtual std::optional<domain::JournalEntry> findBySource(
        int64_t tenantId,
        const std::string& sourceDocument,
        int64_t sourceDocumentId
    ) = 0;

    /**
     * @brief Строки проводки по lineOrder
     */
    virtual std::vector<domain::JournalEntryLine> findLines(int64_t tenantId, int64_t entryId) = 0;

    /**
     * @brief Проводки по фильтру, по дате и id
     */
    virtual std::vector<domain::JournalEntry> findEntries(
        int64_t tenantId,
        const domain::JournalEntryFilter& filter
    ) = 0;

    /**
     * @brief Движения по счёту: по дате проводки, id проводки, lineOrder
     */
    virtual std::vector<domain::AccountMovement> findMovements(int64_t tenantId, int64_t accountId) = 0;

    virtual size_t countLinesForAccount(int64_t tenantId, int64_t accountId) = 0;
};

} // namespace accounting::ports::output
