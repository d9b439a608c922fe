#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Ежемесячная выплата участникам роли
 */
struct AllowanceConfig {
    int64_t id = 0;
    TenantId tenantId;
    std::string roleId;
    AssetId assetId = 0;
    Amount amount;
    bool enabled = true;
};

/**
 * @brief Факт выплаты за период; уникален по (tenant, role, user, asset, yearMonth)
 */
struct AllowanceRecord {
    int64_t id = 0;
    TenantId tenantId;
    std::string roleId;
    UserId userId;
    AssetId assetId = 0;
    std::string yearMonth;   ///< "YYYY-MM"
    Amount amount;
    TransactionId transactionId = 0;
    Timestamp paidAt;
};

struct AllowanceRunSummary {
    int paid = 0;
    int skipped = 0;   ///< уже выплачено за период
    int failed = 0;
};

} // namespace ledger::domain
