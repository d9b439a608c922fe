#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Банковский вклад участника по одному активу
 *
 * Сумма всех вкладов актива равна балансу счёта "bank:{tenant}" в журнале.
 */
struct BankAccount {
    TenantId tenantId;
    UserId userId;
    AssetId assetId = 0;
    Amount balance;
    Timestamp updatedAt;
};

enum class BankOperation {
    DEPOSIT,
    WITHDRAW
};

inline std::string toString(BankOperation op) {
    return op == BankOperation::DEPOSIT ? "deposit" : "withdraw";
}

inline BankOperation parseBankOperation(const std::string& str) {
    return str == "withdraw" ? BankOperation::WITHDRAW : BankOperation::DEPOSIT;
}

struct BankTransaction {
    int64_t id = 0;
    TenantId tenantId;
    UserId userId;
    AssetId assetId = 0;
    BankOperation operation = BankOperation::DEPOSIT;
    Amount amount;
    Amount balanceAfter;
    TransactionId transactionId = 0;
    Timestamp createdAt;
};

/**
 * @brief Сверка: баланс счёта bank в журнале против суммы вкладов
 */
struct BankReconciliation {
    AssetId assetId = 0;
    Amount ledgerBalance;
    Amount depositsTotal;

    bool balanced() const { return ledgerBalance == depositsTotal; }
};

} // namespace ledger::domain
