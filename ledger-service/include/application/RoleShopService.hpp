#pragma once

#include "ports/input/IRoleShopService.hpp"
#include "ports/input/ILedger.hpp"
#include "ports/output/IMemberDirectory.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Магазин ролей
 *
 * Состояния покупки: active (запись есть) -> expired (запись удалена).
 * Роль выдаётся после фиксации оплаты и снимается обходом sweepExpired.
 */
class RoleShopService : public ports::input::IRoleShopService {
public:
    RoleShopService(std::shared_ptr<ports::input::ILedger> ledger,
                    std::shared_ptr<ports::output::IMemberDirectory> members)
        : ledger_(std::move(ledger))
        , members_(std::move(members))
    {}

    // ========================================================================
    // Панели и планы
    // ========================================================================

    int64_t createPanel(const domain::TenantId& tenantId,
                        const std::string& name,
                        const std::string& description) override {
        int64_t id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::RolePanel panel;
            panel.tenantId = tenantId;
            panel.name = name;
            panel.description = description;
            id = unit.session().roles().insertPanel(panel);
        });
        std::cout << "[RoleShopService] Panel " << id << " '" << name << "' in " << tenantId << std::endl;
        return id;
    }

    std::vector<domain::RolePanel> listPanels(const domain::TenantId& tenantId) override {
        std::vector<domain::RolePanel> panels;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            panels = unit.session().roles().listPanels(tenantId);
        });
        return panels;
    }

    void deletePanel(const domain::TenantId& tenantId, int64_t panelId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requirePanel(unit, tenantId, panelId);
            unit.session().roles().deletePanel(panelId);
        });
    }

    int64_t addPlan(const domain::TenantId& tenantId,
                    int64_t panelId,
                    const std::string& name,
                    const std::string& roleId,
                    const std::string& symbol,
                    const domain::Amount& price,
                    int durationHours,
                    const std::string& description) override {
        if (durationHours <= 0) {
            throw domain::InvalidState("Plan duration must be positive, got " + std::to_string(durationHours));
        }

        int64_t id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requirePanel(unit, tenantId, panelId);
            auto asset = unit.requireAsset(tenantId, symbol);
            if (!price.isPositive() || !price.isQuantized(asset.decimals)) {
                throw domain::InvalidAmount("price " + price.toString() + " for " + asset.symbol);
            }

            domain::RolePlan plan;
            plan.panelId = panelId;
            plan.tenantId = tenantId;
            plan.name = name;
            plan.roleId = roleId;
            plan.assetId = asset.id;
            plan.price = price;
            plan.durationHours = durationHours;
            plan.description = description;
            id = unit.session().roles().insertPlan(plan);
        });
        return id;
    }

    std::vector<domain::RolePlan> listPlans(const domain::TenantId& tenantId, int64_t panelId) override {
        std::vector<domain::RolePlan> plans;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requirePanel(unit, tenantId, panelId);
            plans = unit.session().roles().listPlans(panelId);
        });
        return plans;
    }

    void deletePlan(const domain::TenantId& tenantId, int64_t planId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            requirePlan(unit, tenantId, planId);
            unit.session().roles().deletePlan(planId);
        });
    }

    // ========================================================================
    // Покупка и истечение
    // ========================================================================

    domain::RolePurchase purchase(const domain::TenantId& tenantId,
                                  const domain::UserId& userId,
                                  int64_t planId) override {
        domain::RolePurchase purchase;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto plan = requirePlan(unit, tenantId, planId);

            ports::input::TransactionRequest request;
            request.header.tenantId = tenantId;
            request.header.kind = domain::kinds::ROLE_PURCHASE;
            request.header.creatorId = userId;
            request.header.reference = "plan " + std::to_string(planId);
            request.assetId = plan.assetId;
            request.postings = {
                {unit.userAccount(tenantId, userId), -plan.price},
                {unit.systemAccount(tenantId, domain::AccountType::TREASURY), plan.price}
            };

            purchase = domain::RolePurchase();
            purchase.tenantId = tenantId;
            purchase.userId = userId;
            purchase.planId = planId;
            purchase.roleId = plan.roleId;
            purchase.transactionId = TransactionFactory::postWithin(unit, request);
            purchase.purchasedAt = unit.now();
            purchase.expiresAt = unit.now().addHours(plan.durationHours);
            purchase.id = unit.session().roles().insertPurchase(purchase);
        });

        // Списание уже зафиксировано, ошибка выдачи только логируется
        try {
            members_->grantRole(tenantId, userId, purchase.roleId);
        } catch (const std::exception& e) {
            std::cerr << "[RoleShopService] Grant of " << purchase.roleId << " to " << userId
                      << " failed after purchase " << purchase.id << ": " << e.what() << std::endl;
        }
        std::cout << "[RoleShopService] " << userId << " bought plan " << planId << " (role "
                  << purchase.roleId << ") until " << purchase.expiresAt.toString() << std::endl;
        return purchase;
    }

    std::vector<domain::RolePurchase> activePurchases(const domain::TenantId& tenantId,
                                                      const domain::UserId& userId) override {
        std::vector<domain::RolePurchase> active;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            active.clear();
            for (auto& p : unit.session().roles().listPurchases(tenantId, userId)) {
                if (!p.isExpired(unit.now())) {
                    active.push_back(std::move(p));
                }
            }
        });
        return active;
    }

    int sweepExpired(const domain::Timestamp& now, int limit) override {
        std::vector<domain::RolePurchase> expired;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            expired = unit.session().roles().findExpiredPurchases(now, limit);
        });

        int processed = 0;
        for (const auto& candidate : expired) {
            try {
                if (expireOne(candidate.id, now)) {
                    ++processed;
                }
            } catch (const std::exception& e) {
                std::cerr << "[RoleShopService] Failed to expire purchase " << candidate.id
                          << ": " << e.what() << std::endl;
            }
        }

        if (processed > 0) {
            std::cout << "[RoleShopService] Expired " << processed << " purchases" << std::endl;
        }
        return processed;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;
    std::shared_ptr<ports::output::IMemberDirectory> members_;

    /// Одна покупка - одна единица работы; роль снимается после фиксации
    bool expireOne(int64_t purchaseId, const domain::Timestamp& now) {
        std::optional<domain::RolePurchase> purchase;
        bool keepRole = false;

        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            purchase = unit.session().roles().findPurchase(purchaseId);
            if (!purchase || !purchase->isExpired(now)) {
                purchase.reset();
                return;
            }
            keepRole = unit.session().roles().hasOtherActivePurchase(*purchase, now);
            unit.session().roles().deletePurchase(purchaseId);
        });

        if (!purchase) {
            return false;
        }
        if (!keepRole) {
            members_->revokeRole(purchase->tenantId, purchase->userId, purchase->roleId);
        }
        return true;
    }

    static domain::RolePanel requirePanel(ports::input::ILedgerUnit& unit,
                                          const domain::TenantId& tenantId,
                                          int64_t panelId) {
        auto panel = unit.session().roles().findPanel(panelId);
        if (!panel || panel->tenantId != tenantId) {
            throw domain::NotFound("role panel " + std::to_string(panelId) + " in tenant " + tenantId);
        }
        return *panel;
    }

    static domain::RolePlan requirePlan(ports::input::ILedgerUnit& unit,
                                        const domain::TenantId& tenantId,
                                        int64_t planId) {
        auto plan = unit.session().roles().findPlan(planId);
        if (!plan || plan->tenantId != tenantId) {
            throw domain::NotFound("role plan " + std::to_string(planId) + " in tenant " + tenantId);
        }
        return *plan;
    }
};

} // namespace ledger::application
