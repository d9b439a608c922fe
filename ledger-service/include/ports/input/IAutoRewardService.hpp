#pragma once

#include "domain/AutoReward.hpp"
#include "ports/input/ITransactionFactory.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

class IAutoRewardService {
public:
    virtual ~IAutoRewardService() = default;

    /// Создать или заменить конфигурацию канала; @return id
    virtual int64_t configure(const domain::TenantId& tenantId,
                              const std::string& channelId,
                              const std::string& triggerPhrase,
                              const std::string& symbol,
                              const domain::Amount& rewardAmount) = 0;

    /// @throws NotFound
    virtual void setEnabled(const domain::TenantId& tenantId, int64_t configId, bool enabled) = 0;
    virtual void remove(const domain::TenantId& tenantId, int64_t configId) = 0;
    virtual std::vector<domain::AutoRewardConfig> list(const domain::TenantId& tenantId) = 0;
    virtual domain::AutoRewardStats stats(const domain::TenantId& tenantId, int64_t configId) = 0;

    /**
     * @brief Выплатить награду по конфигурации
     * @throws DuplicateClaim, если участник уже получал её
     */
    virtual TransactionReceipt claim(const domain::TenantId& tenantId, int64_t configId,
                                     const domain::UserId& userId) = 0;

    /**
     * @brief Сообщение в канале
     * @return nullopt, если канал без награды или фраза не найдена
     * @throws DuplicateClaim
     */
    virtual std::optional<TransactionReceipt> onMessage(const domain::TenantId& tenantId,
                                                        const std::string& channelId,
                                                        const domain::UserId& userId,
                                                        const std::string& content) = 0;
};

} // namespace ledger::ports::input
