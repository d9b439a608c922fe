#pragma once

#include "domain/Types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Валюта гильдии
 *
 * (tenantId, symbol) уникальны; symbol хранится в верхнем регистре.
 */
struct Asset {
    AssetId id = 0;
    TenantId tenantId;
    std::string symbol;
    std::string name;
    int decimals = 2;   ///< 0..8

    static std::string normalizeSymbol(std::string symbol) {
        std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return symbol;
    }
};

/**
 * @brief Сколько строк удалено каскадом вместе с активом
 */
struct AssetDeletionReport {
    AssetId assetId = 0;
    int64_t ledgerEntries = 0;
    int64_t transactions = 0;
    int64_t balanceRows = 0;
    int64_t rewardConfigs = 0;
    int64_t rewardClaims = 0;
    int64_t bankAccounts = 0;
    int64_t bankTransactions = 0;
    int64_t rolePlans = 0;
    int64_t rolePurchases = 0;  ///< роли по ним не снимаются
    int64_t allowanceConfigs = 0;
    int64_t allowanceRecords = 0;
    int64_t vcRates = 0;
    int64_t vcDailyTotals = 0;
    int64_t bettingEvents = 0;
};

} // namespace ledger::domain
