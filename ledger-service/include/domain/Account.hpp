#pragma once

#include "domain/Types.hpp"
#include "enums/AccountType.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Участник проводок
 *
 * name глобально уникально и служит ключом поиска:
 * - "treasury:{tenant}", "burn:{tenant}", ... для системных счетов
 * - "user:{user}:{tenant}" для участников
 */
struct Account {
    AccountId id = 0;
    std::optional<UserId> ownerId;  ///< пусто для системных счетов
    TenantId tenantId;
    std::string name;
    AccountType type = AccountType::USER;

    static std::string systemName(AccountType type, const TenantId& tenantId) {
        return toString(type) + ":" + tenantId;
    }

    static std::string userName(const UserId& userId, const TenantId& tenantId) {
        return "user:" + userId + ":" + tenantId;
    }
};

} // namespace ledger::domain
