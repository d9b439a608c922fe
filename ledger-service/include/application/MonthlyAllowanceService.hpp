#pragma once

#include "ports/input/IMonthlyAllowanceService.hpp"
#include "ports/input/ILedger.hpp"
#include "ports/output/IMemberDirectory.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Ежемесячные выплаты по ролям
 *
 * Защита от двойной выплаты: строка истории пишется в той же единице,
 * что и проводки, а транзакция несёт ключ идемпотентности периода.
 */
class MonthlyAllowanceService : public ports::input::IMonthlyAllowanceService {
public:
    MonthlyAllowanceService(std::shared_ptr<ports::input::ILedger> ledger,
                            std::shared_ptr<ports::output::IMemberDirectory> members,
                            std::shared_ptr<settings::LedgerSettings> settings)
        : ledger_(std::move(ledger))
        , members_(std::move(members))
        , settings_(std::move(settings))
    {}

    int64_t configure(const domain::TenantId& tenantId,
                      const std::string& roleId,
                      const std::string& symbol,
                      const domain::Amount& amount,
                      bool enabled) override {
        int64_t id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            if (!amount.isPositive() || !amount.isQuantized(asset.decimals)) {
                throw domain::InvalidAmount("allowance " + amount.toString() + " for " + asset.symbol);
            }

            domain::AllowanceConfig config;
            config.tenantId = tenantId;
            config.roleId = roleId;
            config.assetId = asset.id;
            config.amount = amount;
            config.enabled = enabled;
            id = unit.session().allowances().upsertAllowanceConfig(config);
        });
        std::cout << "[MonthlyAllowanceService] Role " << roleId << " in " << tenantId << " gets "
                  << amount << " " << symbol << (enabled ? "" : " (disabled)") << std::endl;
        return id;
    }

    std::vector<domain::AllowanceConfig> listConfigs(const domain::TenantId& tenantId) override {
        std::vector<domain::AllowanceConfig> configs;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            configs = unit.session().allowances().listAllowanceConfigs(tenantId);
        });
        return configs;
    }

    void remove(const domain::TenantId& tenantId, int64_t configId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            bool owned = false;
            for (const auto& c : unit.session().allowances().listAllowanceConfigs(tenantId)) {
                owned = owned || c.id == configId;
            }
            if (!owned) {
                throw domain::NotFound("allowance config " + std::to_string(configId) + " in tenant " + tenantId);
            }
            unit.session().allowances().deleteAllowanceConfig(configId);
        });
    }

    domain::AllowanceRunSummary runMonth(const std::string& yearMonth) override {
        std::vector<domain::AllowanceConfig> configs;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            configs = unit.session().allowances().listEnabledAllowanceConfigs();
        });

        domain::AllowanceRunSummary summary;
        for (const auto& config : configs) {
            for (const auto& userId : members_->membersWithRole(config.tenantId, config.roleId)) {
                try {
                    if (payOne(config, userId, yearMonth)) {
                        ++summary.paid;
                    } else {
                        ++summary.skipped;
                    }
                } catch (const std::exception& e) {
                    ++summary.failed;
                    std::cerr << "[MonthlyAllowanceService] Failed to pay " << userId << " for role "
                              << config.roleId << " in " << config.tenantId << ": " << e.what() << std::endl;
                }
            }
        }

        std::cout << "[MonthlyAllowanceService] " << yearMonth << ": paid " << summary.paid
                  << ", skipped " << summary.skipped << ", failed " << summary.failed << std::endl;
        return summary;
    }

    std::optional<domain::AllowanceRunSummary> runIfPayday(const domain::Timestamp& now, int payday) override {
        const int offset = settings_->getTzOffsetMinutes();
        if (now.localDayOfMonth(offset) != payday) {
            return std::nullopt;
        }
        return runMonth(now.localYearMonth(offset));
    }

    std::vector<domain::AllowanceRecord> history(const domain::TenantId& tenantId,
                                                 const std::string& yearMonth) override {
        std::vector<domain::AllowanceRecord> records;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            records = unit.session().allowances().listAllowanceRecords(tenantId, yearMonth);
        });
        return records;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;
    std::shared_ptr<ports::output::IMemberDirectory> members_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /// @return false, если за период уже выплачено
    bool payOne(const domain::AllowanceConfig& config, const domain::UserId& userId,
                const std::string& yearMonth) {
        bool paid = false;
        try {
            ledger_->transact([&](ports::input::ILedgerUnit& unit) {
                paid = false;
                auto& store = unit.session().allowances();
                if (store.hasAllowanceRecord(config.tenantId, config.roleId, userId, config.assetId, yearMonth)) {
                    return;
                }

                ports::input::TransactionRequest request;
                request.header.tenantId = config.tenantId;
                request.header.kind = domain::kinds::MONTHLY_ALLOWANCE;
                request.header.idempotencyKey = config.tenantId + ":" + config.roleId + ":" + userId + ":" +
                                                std::to_string(config.assetId) + ":" + yearMonth;
                request.header.reference = "role " + config.roleId + " " + yearMonth;
                request.assetId = config.assetId;
                request.postings = {
                    {unit.systemAccount(config.tenantId, domain::AccountType::TREASURY), -config.amount},
                    {unit.userAccount(config.tenantId, userId), config.amount}
                };

                domain::AllowanceRecord record;
                record.tenantId = config.tenantId;
                record.roleId = config.roleId;
                record.userId = userId;
                record.assetId = config.assetId;
                record.yearMonth = yearMonth;
                record.amount = config.amount;
                record.transactionId = TransactionFactory::postWithin(unit, request);
                record.paidAt = unit.now();
                if (!store.insertAllowanceRecord(record)) {
                    throw domain::DuplicateClaim("allowance " + *request.header.idempotencyKey);
                }
                paid = true;
            });
        } catch (const domain::DuplicateTransaction&) {
            return false;
        } catch (const domain::DuplicateClaim&) {
            return false;
        }
        return paid;
    }
};

} // namespace ledger::application
