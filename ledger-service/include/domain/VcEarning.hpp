#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Откуда берутся начисления за время в голосовых каналах
 *
 * TREASURY - как остальные награды, казна -> участник.
 * MINT - инфляционный кран, mint -> участник.
 */
enum class VcFundingSource {
    TREASURY,
    MINT
};

inline std::string toString(VcFundingSource source) {
    return source == VcFundingSource::MINT ? "mint" : "treasury";
}

inline VcFundingSource parseVcFundingSource(const std::string& str) {
    if (str == "treasury") return VcFundingSource::TREASURY;
    if (str == "mint") return VcFundingSource::MINT;
    throw std::invalid_argument("Unknown VC funding source: " + str);
}

/// Поминутная ставка для категории каналов
struct VcEarningRate {
    int64_t id = 0;
    TenantId tenantId;
    std::string categoryId;
    AssetId assetId = 0;
    Amount ratePerMinute;
};

/// Текущее присутствие в голосовом канале, одна запись на (tenant, user)
struct VcSession {
    TenantId tenantId;
    UserId userId;
    std::string channelId;
    std::string categoryId;
    Timestamp startedAt;
};

/// Дневной итог начислений (только для отображения)
struct VcDailyTotal {
    TenantId tenantId;
    UserId userId;
    AssetId assetId = 0;
    std::string date;   ///< "YYYY-MM-DD" в часовом поясе тенанта
    Amount total;
};

struct VcPayoutSummary {
    int credited = 0;
    int skipped = 0;
    int failed = 0;
};

} // namespace ledger::domain
