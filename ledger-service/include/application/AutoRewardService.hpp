#pragma once

#include "ports/input/IAutoRewardService.hpp"
#include "ports/input/ILedger.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Награды за фразу в канале
 *
 * Выплата и запись о получении - одна единица работы; уникальность
 * (config, user) в хранилище откатывает повторную выплату.
 */
class AutoRewardService : public ports::input::IAutoRewardService {
public:
    explicit AutoRewardService(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    int64_t configure(const domain::TenantId& tenantId,
                      const std::string& channelId,
                      const std::string& triggerPhrase,
                      const std::string& symbol,
                      const domain::Amount& rewardAmount) override {
        if (triggerPhrase.empty()) {
            throw domain::InvalidState("Trigger phrase must not be empty");
        }

        int64_t id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            auto reward = rewardAmount.quantize(asset.decimals, domain::RoundingMode::HALF_EVEN);
            if (!reward.isPositive()) {
                throw domain::InvalidAmount("reward " + rewardAmount.toString() + " is not positive");
            }

            domain::AutoRewardConfig config;
            config.tenantId = tenantId;
            config.channelId = channelId;
            config.triggerPhrase = triggerPhrase;
            config.rewardAmount = reward;
            config.assetId = asset.id;
            config.enabled = true;
            config.createdAt = unit.now();
            id = unit.session().rewards().upsertRewardConfig(config);
        });

        std::cout << "[AutoRewardService] Channel " << channelId << " in " << tenantId
                  << " rewards " << rewardAmount << " " << symbol << " (config " << id << ")" << std::endl;
        return id;
    }

    void setEnabled(const domain::TenantId& tenantId, int64_t configId, bool enabled) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requireConfig(unit, tenantId, configId);
            unit.session().rewards().setRewardConfigEnabled(configId, enabled);
        });
    }

    void remove(const domain::TenantId& tenantId, int64_t configId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requireConfig(unit, tenantId, configId);
            unit.session().rewards().deleteRewardConfig(configId);
        });
        std::cout << "[AutoRewardService] Removed config " << configId << std::endl;
    }

    std::vector<domain::AutoRewardConfig> list(const domain::TenantId& tenantId) override {
        std::vector<domain::AutoRewardConfig> configs;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            configs = unit.session().rewards().listRewardConfigs(tenantId);
        });
        return configs;
    }

    domain::AutoRewardStats stats(const domain::TenantId& tenantId, int64_t configId) override {
        domain::AutoRewardStats stats;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto config = requireConfig(unit, tenantId, configId);
            stats.claims = unit.session().rewards().countRewardClaims(configId);
            stats.totalPaid = config.rewardAmount.multiply(domain::Amount::whole(stats.claims),
                                                           domain::Amount::kScale,
                                                           domain::RoundingMode::DOWN);
        });
        return stats;
    }

    ports::input::TransactionReceipt claim(const domain::TenantId& tenantId, int64_t configId,
                                           const domain::UserId& userId) override {
        ports::input::TransactionReceipt receipt;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto config = requireConfig(unit, tenantId, configId);
            if (!config.enabled) {
                throw domain::InvalidState("Reward " + std::to_string(configId) + " is disabled");
            }

            ports::input::TransactionRequest request;
            request.header.tenantId = tenantId;
            request.header.kind = domain::kinds::AUTO_REWARD;
            request.header.reference = "config " + std::to_string(configId);
            request.assetId = config.assetId;
            request.postings = {
                {unit.systemAccount(tenantId, domain::AccountType::TREASURY), -config.rewardAmount},
                {unit.userAccount(tenantId, userId), config.rewardAmount}
            };
            receipt.transactionId = TransactionFactory::postWithin(unit, request);

            domain::AutoRewardClaim record;
            record.configId = configId;
            record.userId = userId;
            record.transactionId = receipt.transactionId;
            record.claimedAt = unit.now();
            if (!unit.session().rewards().insertRewardClaim(record)) {
                throw domain::DuplicateClaim("user " + userId + " already claimed reward " +
                                             std::to_string(configId));
            }
        });

        std::cout << "[AutoRewardService] " << userId << " claimed reward " << configId
                  << " -> transaction " << receipt.transactionId << std::endl;
        return receipt;
    }

    std::optional<ports::input::TransactionReceipt> onMessage(const domain::TenantId& tenantId,
                                                              const std::string& channelId,
                                                              const domain::UserId& userId,
                                                              const std::string& content) override {
        std::optional<domain::AutoRewardConfig> config;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            config = unit.session().rewards().findRewardConfigByChannel(tenantId, channelId);
        });
        if (!config || !config->matches(content)) {
            return std::nullopt;
        }
        return claim(tenantId, config->id, userId);
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;

    static domain::AutoRewardConfig requireConfig(ports::input::ILedgerUnit& unit,
                                                  const domain::TenantId& tenantId,
                                                  int64_t configId) {
        auto config = unit.session().rewards().findRewardConfig(configId);
        if (!config || config->tenantId != tenantId) {
            throw domain::NotFound("reward config " + std::to_string(configId) + " in tenant " + tenantId);
        }
        return *config;
    }
};

} // namespace ledger::application
