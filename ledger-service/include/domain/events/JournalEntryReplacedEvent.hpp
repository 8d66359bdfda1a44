#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Событие: строки проводки заменены на месте
 */
struct JournalEntryReplacedEvent : public DomainEvent {
    int64_t tenantId = 0;
    int64_t entryId = 0;
    Money previousTotal;
    Money totalAmount;
    size_t lineCount = 0;
    std::optional<std::string> sourceDocument;
    std::optional<int64_t> sourceDocumentId;
    std::vector<int64_t> accountIds;    ///< счета старых и новых строк

    JournalEntryReplacedEvent() : DomainEvent("journal.entry_replaced") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalEntryReplacedEvent>(*this);
    }
};

} // namespace accounting::domain
