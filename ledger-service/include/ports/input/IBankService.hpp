#pragma once

#include "domain/Bank.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Вклады участников (счёт bank:{tenant})
 */
class IBankService {
public:
    virtual ~IBankService() = default;

    /// Сумма усекается до точности актива; @throws InsufficientBalance, InvalidAmount
    virtual domain::BankTransaction deposit(const domain::TenantId& tenantId,
                                            const domain::UserId& userId,
                                            const std::string& symbol,
                                            const domain::Amount& amount) = 0;

    /// @throws InsufficientBalance, если вклад меньше суммы
    virtual domain::BankTransaction withdraw(const domain::TenantId& tenantId,
                                             const domain::UserId& userId,
                                             const std::string& symbol,
                                             const domain::Amount& amount) = 0;

    virtual domain::Amount balance(const domain::TenantId& tenantId,
                                   const domain::UserId& userId,
                                   const std::string& symbol) = 0;

    /// Последние операции, новые первыми
    virtual std::vector<domain::BankTransaction> history(const domain::TenantId& tenantId,
                                                         const domain::UserId& userId,
                                                         const std::string& symbol,
                                                         int limit = 20) = 0;

    virtual domain::BankReconciliation reconcile(const domain::TenantId& tenantId,
                                                 const std::string& symbol) = 0;
};

} // namespace ledger::ports::input
