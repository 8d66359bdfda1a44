#include "domain/events/JournalEntryReplacedEvent.hpp"
#include <nlohmann/json.hpp>

namespace accounting::domain {

std::string JournalEntryReplacedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tenantId"] = tenantId;
    j["entryId"] = entryId;
    j["previousTotal"] = previousTotal.toString();
    j["totalAmount"] = totalAmount.toString();
    j["lineCount"] = lineCount;
    j["sourceDocument"] = sourceDocument ? nlohmann::json(*sourceDocument) : nlohmann::json(nullptr);
    j["sourceDocumentId"] = sourceDocumentId ? nlohmann::json(*sourceDocumentId) : nlohmann::json(nullptr);
    j["accountIds"] = accountIds;
    return j.dump();
}

} // namespace accounting::domain
