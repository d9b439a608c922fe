#include "domain/events/TransactionCommittedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string TransactionCommittedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["transactionId"] = transactionId;
    j["tenantId"] = header.tenantId;
    j["kind"] = header.kind;
    j["creatorId"] = header.creatorId ? nlohmann::json(*header.creatorId) : nlohmann::json();
    j["idempotencyKey"] = header.idempotencyKey ? nlohmann::json(*header.idempotencyKey) : nlohmann::json();
    j["reference"] = header.reference ? nlohmann::json(*header.reference) : nlohmann::json();

    nlohmann::json entriesJson = nlohmann::json::array();
    for (const auto& e : entries) {
        entriesJson.push_back({
            {"accountId", e.accountId},
            {"assetId", e.assetId},
            {"amount", e.amount.toString()}
        });
    }
    j["entries"] = entriesJson;
    return j.dump();
}

} // namespace ledger::domain
