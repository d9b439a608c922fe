#include "domain/events/TreasuryRefilledEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string TreasuryRefilledEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tenantId"] = tenantId;
    j["treasuryAccountId"] = treasuryAccountId;
    j["assetId"] = assetId;
    j["amount"] = amount.toString();
    j["balanceAfter"] = balanceAfter.toString();
    j["transactionId"] = transactionId;
    return j.dump();
}

} // namespace ledger::domain
