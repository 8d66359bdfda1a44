#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Строка проводки
 */
struct JournalEntryLine {
    int64_t id = 0;
    int64_t journalEntryId = 0;
    int64_t accountId = 0;
    Money debitAmount;
    Money creditAmount;
    int lineOrder = 0;      ///< 1..N, стабильный порядок
    std::string description;
};

/**
 * @brief Заголовок проводки
 *
 * Инвариант: сумма дебетов строк равна сумме кредитов и равна totalAmount.
 */
struct JournalEntry {
    int64_t id = 0;
    int64_t tenantId = 0;
    Timestamp entryDate;
    std::string reference;
    std::string entryType;          ///< "INVAP", "PMT", "manual", ...
    std::string description;
    bool isPosted = false;
    std::optional<std::string> sourceDocument;     ///< "invoice", "payment"
    std::optional<int64_t> sourceDocumentId;
    Money totalAmount;
    std::string createdBy;
    std::string updatedBy;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool hasSource() const {
        return sourceDocument.has_value() && sourceDocumentId.has_value();
    }
};

/**
 * @brief Строка во входных данных createEntry / replaceLines
 *
 * lineOrder = 0 означает "назначить по позиции".
 */
struct JournalLineInput {
    int64_t accountId = 0;
    Money debitAmount;
    Money creditAmount;
    std::string description;
    int lineOrder = 0;

    static JournalLineInput debit(int64_t accountId, Money amount, std::string description = "") {
        JournalLineInput line;
        line.accountId = accountId;
        line.debitAmount = amount;
        line.description = std::move(description);
        return line;
    }

    static JournalLineInput credit(int64_t accountId, Money amount, std::string description = "") {
        JournalLineInput line;
        line.accountId = accountId;
        line.creditAmount = amount;
        line.description = std::move(description);
        return line;
    }
};

/**
 * @brief Заголовок новой проводки
 */
struct JournalEntryHeader {
    int64_t tenantId = 0;
    Timestamp entryDate;
    std::string reference;
    std::string entryType = "manual";
    std::string description;
    bool isPosted = false;
    std::optional<std::string> sourceDocument;
    std::optional<int64_t> sourceDocumentId;
    std::string createdBy;
};

/**
 * @brief Частичное обновление заголовка при replaceLines
 */
struct JournalHeaderUpdate {
    std::optional<Timestamp> entryDate;
    std::optional<std::string> reference;
    std::optional<std::string> description;
    std::optional<bool> isPosted;
    std::string updatedBy;
};

/**
 * @brief Фильтр listEntries
 */
struct JournalEntryFilter {
    std::optional<Timestamp> fromDate;      ///< включительно
    std::optional<Timestamp> toDate;        ///< включительно
    std::optional<std::string> entryType;
    std::optional<bool> isPosted;
    std::optional<std::string> sourceDocument;
};

/**
 * @brief Строка проводки вместе с заголовком, для выписки по счёту
 */
struct AccountMovement {
    int64_t entryId = 0;
    Timestamp entryDate;
    std::string reference;
    std::string entryType;
    std::string entryDescription;
    bool isPosted = false;
    int64_t lineId = 0;
    int lineOrder = 0;
    std::string lineDescription;
    Money debitAmount;
    Money creditAmount;
};

} // namespace accounting::domain
