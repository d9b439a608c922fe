#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Награда за сообщение с фразой-триггером в канале
 *
 * Одна конфигурация на (tenant, channel); каждый участник получает
 * награду не более одного раза.
 */
struct AutoRewardConfig {
    int64_t id = 0;
    TenantId tenantId;
    std::string channelId;
    std::string triggerPhrase;
    Amount rewardAmount;
    AssetId assetId = 0;
    bool enabled = true;
    Timestamp createdAt;

    bool matches(const std::string& content) const {
        return enabled && !triggerPhrase.empty() &&
               content.find(triggerPhrase) != std::string::npos;
    }
};

struct AutoRewardClaim {
    int64_t id = 0;
    int64_t configId = 0;
    UserId userId;
    TransactionId transactionId = 0;
    Timestamp claimedAt;
};

struct AutoRewardStats {
    int64_t claims = 0;
    Amount totalPaid;
};

} // namespace ledger::domain
