#include "domain/events/AccountCreatedEvent.hpp"
#include <nlohmann/json.hpp>

namespace accounting::domain {

std::string AccountCreatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tenantId"] = tenantId;
    j["accountId"] = accountId;
    j["detailedGroupId"] = detailedGroupId;
    j["accountCode"] = accountCode;
    j["accountName"] = accountName;
    j["accountType"] = toString(accountType);
    j["isSystemAccount"] = isSystemAccount;
    return j.dump();
}

} // namespace accounting::domain
