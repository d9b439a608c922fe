#pragma once

#include "adapters/secondary/PeriodicTask.hpp"
#include "ports/input/IMonthlyAllowanceService.hpp"
#include "ports/input/IRoleShopService.hpp"
#include "ports/input/IVcEarningService.hpp"
#include "ports/output/IClock.hpp"
#include "settings/SchedulerSettings.hpp"
#include <iostream>
#include <memory>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Фоновые обходы
 *
 * Каждый обход - отдельная PeriodicTask; внутри обхода каждая сущность
 * обрабатывается своей единицей работы.
 */
class ScheduledJobs {
public:
    ScheduledJobs(std::shared_ptr<ports::input::IRoleShopService> roleShop,
                  std::shared_ptr<ports::input::IMonthlyAllowanceService> allowances,
                  std::shared_ptr<ports::input::IVcEarningService> voice,
                  std::shared_ptr<ports::output::IClock> clock,
                  std::shared_ptr<settings::SchedulerSettings> settings)
        : roleShop_(std::move(roleShop))
        , allowances_(std::move(allowances))
        , voice_(std::move(voice))
        , clock_(std::move(clock))
        , settings_(std::move(settings))
    {
        roleExpiry_ = std::make_unique<secondary::PeriodicTask>(
            "role-expiry",
            [this] { roleShop_->sweepExpired(clock_->now(), settings_->getExpiryBatch()); },
            settings_->getRoleExpiryInterval());

        allowance_ = std::make_unique<secondary::PeriodicTask>(
            "monthly-allowance",
            [this] { allowances_->runIfPayday(clock_->now(), settings_->getAllowancePayday()); },
            settings_->getAllowanceInterval());

        vcPayout_ = std::make_unique<secondary::PeriodicTask>(
            "vc-payout",
            [this] { voice_->payoutTick(); },
            settings_->getVcTickInterval());

        vcCleanup_ = std::make_unique<secondary::PeriodicTask>(
            "vc-daily-cleanup",
            [this] { voice_->cleanupDaily(settings_->getVcRetentionDays()); },
            settings_->getVcCleanupInterval());
    }

    ~ScheduledJobs() {
        stop();
    }

    ScheduledJobs(const ScheduledJobs&) = delete;
    ScheduledJobs& operator=(const ScheduledJobs&) = delete;

    void start() {
        for (auto* task : tasks()) {
            task->start();
        }
        std::cout << "[ScheduledJobs] " << tasks().size() << " tasks running" << std::endl;
    }

    void stop() {
        for (auto* task : tasks()) {
            task->stop();
        }
    }

    secondary::PeriodicTask& roleExpiry() { return *roleExpiry_; }
    secondary::PeriodicTask& allowance() { return *allowance_; }
    secondary::PeriodicTask& vcPayout() { return *vcPayout_; }
    secondary::PeriodicTask& vcCleanup() { return *vcCleanup_; }

private:
    std::shared_ptr<ports::input::IRoleShopService> roleShop_;
    std::shared_ptr<ports::input::IMonthlyAllowanceService> allowances_;
    std::shared_ptr<ports::input::IVcEarningService> voice_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::SchedulerSettings> settings_;

    std::unique_ptr<secondary::PeriodicTask> roleExpiry_;
    std::unique_ptr<secondary::PeriodicTask> allowance_;
    std::unique_ptr<secondary::PeriodicTask> vcPayout_;
    std::unique_ptr<secondary::PeriodicTask> vcCleanup_;

    std::vector<secondary::PeriodicTask*> tasks() {
        return {roleExpiry_.get(), allowance_.get(), vcPayout_.get(), vcCleanup_.get()};
    }
};

} // namespace ledger::adapters::primary
