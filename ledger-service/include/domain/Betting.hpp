#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Тотализатор: не больше одного активного события на тенант
 *
 * Ставки лежат на счёте "escrow:{tenant}" до расчёта или отмены.
 */
struct BettingEvent {
    int64_t id = 0;
    TenantId tenantId;
    std::string title;
    AssetId assetId = 0;
    bool active = true;
    std::optional<UserId> winnerId;
    Timestamp createdAt;
};

struct Bet {
    int64_t id = 0;
    int64_t eventId = 0;
    UserId bettorId;
    UserId targetId;
    Amount stake;
    TransactionId transactionId = 0;
};

/// Коэффициент и объём ставок на участника
struct PlayerOdds {
    UserId playerId;
    Amount staked;
    Amount odds;
};

struct Payout {
    UserId userId;
    Amount stake;
    Amount amount;
};

struct SettlementResult {
    TransactionId transactionId = 0;
    Amount pool;
    Amount odds;
    Amount totalPaid;
    Amount treasuryDelta;   ///< >0 - в казну, <0 - из казны
    std::vector<Payout> payouts;
};

} // namespace ledger::domain
