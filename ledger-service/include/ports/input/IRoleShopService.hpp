#pragma once

#include "domain/RoleShop.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Магазин ролей на время
 */
class IRoleShopService {
public:
    virtual ~IRoleShopService() = default;

    virtual int64_t createPanel(const domain::TenantId& tenantId,
                                const std::string& name,
                                const std::string& description) = 0;
    virtual std::vector<domain::RolePanel> listPanels(const domain::TenantId& tenantId) = 0;
    /// Удаляет панель вместе с планами; покупки остаются до истечения
    virtual void deletePanel(const domain::TenantId& tenantId, int64_t panelId) = 0;

    virtual int64_t addPlan(const domain::TenantId& tenantId,
                            int64_t panelId,
                            const std::string& name,
                            const std::string& roleId,
                            const std::string& symbol,
                            const domain::Amount& price,
                            int durationHours,
                            const std::string& description) = 0;
    virtual std::vector<domain::RolePlan> listPlans(const domain::TenantId& tenantId, int64_t panelId) = 0;
    virtual void deletePlan(const domain::TenantId& tenantId, int64_t planId) = 0;

    /**
     * @brief Купить план: user -> treasury, запись покупки, выдача роли
     * @throws NotFound, InsufficientBalance
     */
    virtual domain::RolePurchase purchase(const domain::TenantId& tenantId,
                                          const domain::UserId& userId,
                                          int64_t planId) = 0;

    virtual std::vector<domain::RolePurchase> activePurchases(const domain::TenantId& tenantId,
                                                              const domain::UserId& userId) = 0;

    /// Снять истёкшие роли; @return сколько покупок обработано
    virtual int sweepExpired(const domain::Timestamp& now, int limit) = 0;
};

} // namespace ledger::ports::input
