#include "domain/events/AssetDeletedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string AssetDeletedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tenantId"] = tenantId;
    j["symbol"] = symbol;
    j["assetId"] = report.assetId;
    j["deleted"] = {
        {"ledgerEntries", report.ledgerEntries},
        {"transactions", report.transactions},
        {"balanceRows", report.balanceRows},
        {"rewardConfigs", report.rewardConfigs},
        {"rewardClaims", report.rewardClaims},
        {"bankAccounts", report.bankAccounts},
        {"bankTransactions", report.bankTransactions},
        {"rolePlans", report.rolePlans},
        {"rolePurchases", report.rolePurchases},
        {"allowanceConfigs", report.allowanceConfigs},
        {"allowanceRecords", report.allowanceRecords},
        {"vcRates", report.vcRates},
        {"vcDailyTotals", report.vcDailyTotals},
        {"bettingEvents", report.bettingEvents}
    };
    return j.dump();
}

} // namespace ledger::domain
