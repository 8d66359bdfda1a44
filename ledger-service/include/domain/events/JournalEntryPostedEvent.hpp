#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Событие: проводка создана или помечена как проведённая
 */
struct JournalEntryPostedEvent : public DomainEvent {
    int64_t tenantId = 0;
    int64_t entryId = 0;
    std::string entryType;
    std::string reference;
    bool isPosted = false;
    Money totalAmount;
    size_t lineCount = 0;
    std::optional<std::string> sourceDocument;
    std::optional<int64_t> sourceDocumentId;
    std::vector<int64_t> accountIds;    ///< счета, по которым прошли движения

    JournalEntryPostedEvent() : DomainEvent("journal.entry_posted") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalEntryPostedEvent>(*this);
    }
};

} // namespace accounting::domain
