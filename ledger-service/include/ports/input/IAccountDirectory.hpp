#pragma once

#include "domain/Account.hpp"
#include <string>

namespace ledger::ports::input {

/**
 * @brief Справочник счетов
 */
class IAccountDirectory {
public:
    virtual ~IAccountDirectory() = default;

    /// Создаёт treasury, burn, mint, bank, escrow, если их нет
    virtual void ensureSystemAccounts(const domain::TenantId& tenantId) = 0;

    /// get-or-create, безопасен при параллельных вызовах
    virtual domain::AccountId ensureUserAccount(const domain::TenantId& tenantId,
                                                const domain::UserId& userId) = 0;

    /**
     * @param logicalName "treasury", "burn", "mint", "bank" или "escrow"
     * @throws AccountNotFound, если тенант не инициализирован
     */
    virtual domain::AccountId accountIdByName(const domain::TenantId& tenantId,
                                              const std::string& logicalName) = 0;
};

} // namespace ledger::ports::input
