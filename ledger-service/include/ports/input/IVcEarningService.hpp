#pragma once

#include "domain/VcEarning.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Начисления за время в голосовых каналах
 */
class IVcEarningService {
public:
    virtual ~IVcEarningService() = default;

    virtual void setRate(const domain::TenantId& tenantId,
                         const std::string& categoryId,
                         const std::string& symbol,
                         const domain::Amount& ratePerMinute) = 0;
    virtual void removeRate(const domain::TenantId& tenantId, const std::string& categoryId) = 0;
    virtual std::vector<domain::VcEarningRate> listRates(const domain::TenantId& tenantId) = 0;

    virtual void startSession(const domain::TenantId& tenantId,
                              const domain::UserId& userId,
                              const std::string& channelId,
                              const std::string& categoryId) = 0;
    /// Переход в другой канал; время начала сохраняется
    virtual void moveSession(const domain::TenantId& tenantId,
                             const domain::UserId& userId,
                             const std::string& channelId,
                             const std::string& categoryId) = 0;
    virtual void endSession(const domain::TenantId& tenantId, const domain::UserId& userId) = 0;
    /// Сброс всех сессий при старте хоста; @return число удалённых
    virtual int64_t clearSessions() = 0;

    /// Поминутное начисление по всем сессиям
    virtual domain::VcPayoutSummary payoutTick() = 0;

    /// Удалить дневные итоги старше retentionDays; @return число строк
    virtual int64_t cleanupDaily(int retentionDays) = 0;

    virtual std::vector<domain::VcDailyTotal> todayEarnings(const domain::TenantId& tenantId,
                                                            const domain::UserId& userId) = 0;
};

} // namespace ledger::ports::input
