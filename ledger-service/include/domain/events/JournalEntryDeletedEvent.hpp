#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Событие: проводка удалена вместе со строками
 */
struct JournalEntryDeletedEvent : public DomainEvent {
    int64_t tenantId = 0;
    int64_t entryId = 0;
    Money totalAmount;
    std::optional<std::string> sourceDocument;
    std::optional<int64_t> sourceDocumentId;
    std::vector<int64_t> accountIds;

    JournalEntryDeletedEvent() : DomainEvent("journal.entry_deleted") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalEntryDeletedEvent>(*this);
    }
};

} // namespace accounting::domain
