#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Витрина ролей (набор планов под одной кнопкой)
 */
struct RolePanel {
    int64_t id = 0;
    TenantId tenantId;
    std::string name;
    std::string description;
};

/**
 * @brief Платная роль на ограниченный срок
 */
struct RolePlan {
    int64_t id = 0;
    int64_t panelId = 0;
    TenantId tenantId;
    std::string name;
    std::string roleId;
    AssetId assetId = 0;
    Amount price;
    int durationHours = 0;
    std::string description;
};

/**
 * @brief Активная покупка: active пока существует, expired - удалена
 *
 * roleId копируется из плана, чтобы снять роль и после удаления плана.
 */
struct RolePurchase {
    int64_t id = 0;
    TenantId tenantId;
    UserId userId;
    int64_t planId = 0;
    std::string roleId;
    TransactionId transactionId = 0;
    Timestamp purchasedAt;
    Timestamp expiresAt;

    bool isExpired(const Timestamp& now) const { return expiresAt <= now; }
};

} // namespace ledger::domain
