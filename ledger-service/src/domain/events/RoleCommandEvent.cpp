#include "domain/events/RoleCommandEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string RoleCommandEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tenantId"] = tenantId;
    j["userId"] = userId;
    j["roleId"] = roleId;
    j["reason"] = reason;
    return j.dump();
}

} // namespace ledger::domain
