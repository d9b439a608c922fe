#pragma once

#include "ports/input/IVcEarningService.hpp"
#include "ports/input/ILedger.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Поминутные начисления за присутствие в голосовых каналах
 *
 * Сессии хранятся в хранилище, а не в памяти процесса. Источник средств
 * задаётся LEDGER_VC_FUNDING: treasury (как прочие награды) или mint.
 * В обоих случаях начисление - сбалансированная транзакция.
 */
class VcEarningService : public ports::input::IVcEarningService {
public:
    VcEarningService(std::shared_ptr<ports::input::ILedger> ledger,
                     std::shared_ptr<settings::LedgerSettings> settings)
        : ledger_(std::move(ledger))
        , settings_(std::move(settings))
    {}

    void setRate(const domain::TenantId& tenantId,
                 const std::string& categoryId,
                 const std::string& symbol,
                 const domain::Amount& ratePerMinute) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            if (!ratePerMinute.isPositive()) {
                throw domain::InvalidAmount("rate " + ratePerMinute.toString() + " is not positive");
            }

            domain::VcEarningRate rate;
            rate.tenantId = tenantId;
            rate.categoryId = categoryId;
            rate.assetId = asset.id;
            rate.ratePerMinute = ratePerMinute;
            unit.session().voice().upsertVcRate(rate);
        });
        std::cout << "[VcEarningService] Category " << categoryId << " in " << tenantId
                  << " earns " << ratePerMinute << " " << symbol << "/min" << std::endl;
    }

    void removeRate(const domain::TenantId& tenantId, const std::string& categoryId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            if (!unit.session().voice().deleteVcRate(tenantId, categoryId)) {
                throw domain::NotFound("VC rate for category " + categoryId + " in tenant " + tenantId);
            }
        });
    }

    std::vector<domain::VcEarningRate> listRates(const domain::TenantId& tenantId) override {
        std::vector<domain::VcEarningRate> rates;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            rates = unit.session().voice().listVcRates(tenantId);
        });
        return rates;
    }

    void startSession(const domain::TenantId& tenantId,
                      const domain::UserId& userId,
                      const std::string& channelId,
                      const std::string& categoryId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::VcSession session;
            session.tenantId = tenantId;
            session.userId = userId;
            session.channelId = channelId;
            session.categoryId = categoryId;
            session.startedAt = unit.now();
            unit.session().voice().upsertVcSession(session);
        });
    }

    void moveSession(const domain::TenantId& tenantId,
                     const domain::UserId& userId,
                     const std::string& channelId,
                     const std::string& categoryId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto& voice = unit.session().voice();
            auto session = voice.findVcSession(tenantId, userId);
            domain::VcSession updated;
            updated.tenantId = tenantId;
            updated.userId = userId;
            updated.startedAt = session ? session->startedAt : unit.now();
            updated.channelId = channelId;
            updated.categoryId = categoryId;
            voice.upsertVcSession(updated);
        });
    }

    void endSession(const domain::TenantId& tenantId, const domain::UserId& userId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            unit.session().voice().deleteVcSession(tenantId, userId);
        });
    }

    int64_t clearSessions() override {
        int64_t removed = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            removed = unit.session().voice().clearVcSessions();
        });
        std::cout << "[VcEarningService] Cleared " << removed << " sessions" << std::endl;
        return removed;
    }

    domain::VcPayoutSummary payoutTick() override {
        std::vector<domain::VcSession> sessions;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            sessions = unit.session().voice().listVcSessions();
        });

        domain::VcPayoutSummary summary;
        for (const auto& session : sessions) {
            try {
                if (creditOne(session)) {
                    ++summary.credited;
                } else {
                    ++summary.skipped;
                }
            } catch (const std::exception& e) {
                ++summary.failed;
                std::cerr << "[VcEarningService] Payout failed for " << session.userId
                          << " in " << session.tenantId << ": " << e.what() << std::endl;
            }
        }
        return summary;
    }

    int64_t cleanupDaily(int retentionDays) override {
        int64_t removed = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto cutoff = unit.now().addDays(-retentionDays).localDate(settings_->getTzOffsetMinutes());
            removed = unit.session().voice().purgeVcDailyBefore(cutoff);
        });
        std::cout << "[VcEarningService] Removed " << removed << " daily totals" << std::endl;
        return removed;
    }

    std::vector<domain::VcDailyTotal> todayEarnings(const domain::TenantId& tenantId,
                                                    const domain::UserId& userId) override {
        std::vector<domain::VcDailyTotal> totals;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto today = unit.now().localDate(settings_->getTzOffsetMinutes());
            totals = unit.session().voice().listVcDaily(tenantId, userId, today);
        });
        return totals;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /// @return false, если сессия уже завершена или для категории нет ставки
    bool creditOne(const domain::VcSession& listed) {
        bool credited = false;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            credited = false;
            auto current = unit.session().voice().findVcSession(listed.tenantId, listed.userId);
            if (!current) {
                return;
            }
            const auto& session = *current;
            auto rate = unit.session().voice().findVcRate(session.tenantId, session.categoryId);
            if (!rate) {
                return;
            }
            auto asset = unit.requireAsset(rate->assetId);
            auto amount = rate->ratePerMinute.quantize(asset.decimals, domain::RoundingMode::HALF_EVEN);
            if (!amount.isPositive()) {
                return;
            }

            auto sourceType = settings_->getVcFunding() == domain::VcFundingSource::MINT
                                  ? domain::AccountType::MINT
                                  : domain::AccountType::TREASURY;

            ports::input::TransactionRequest request;
            request.header.tenantId = session.tenantId;
            request.header.kind = domain::kinds::VC_EARNING;
            request.header.reference = "category " + session.categoryId;
            request.assetId = asset.id;
            request.postings = {
                {unit.systemAccount(session.tenantId, sourceType), -amount},
                {unit.userAccount(session.tenantId, session.userId), amount}
            };
            TransactionFactory::postWithin(unit, request);

            domain::VcDailyTotal delta;
            delta.tenantId = session.tenantId;
            delta.userId = session.userId;
            delta.assetId = asset.id;
            delta.date = unit.now().localDate(settings_->getTzOffsetMinutes());
            delta.total = amount;
            unit.session().voice().addVcDaily(delta);
            credited = true;
        });
        return credited;
    }
};

} // namespace ledger::application
