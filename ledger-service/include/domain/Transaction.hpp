#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Types.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Теги транзакций (только для отчётности, на семантику не влияют)
 */
namespace kinds {
inline constexpr const char* TRANSFER = "transfer";
inline constexpr const char* ISSUE = "issue";
inline constexpr const char* BURN = "burn";
inline constexpr const char* AUTO_TREASURY_REFILL = "auto_treasury_refill";
inline constexpr const char* AUTO_REWARD = "auto_reward";
inline constexpr const char* BANK_DEPOSIT = "bank_deposit";
inline constexpr const char* BANK_WITHDRAW = "bank_withdraw";
inline constexpr const char* ROLE_PURCHASE = "role_purchase";
inline constexpr const char* MONTHLY_ALLOWANCE = "monthly_allowance";
inline constexpr const char* VC_EARNING = "vc_earning";
inline constexpr const char* BET = "bet";
inline constexpr const char* BET_PAYOUT = "bet_payout";
inline constexpr const char* BET_REFUND = "bet_refund";
} // namespace kinds

/**
 * @brief Заголовок новой транзакции
 */
struct TransactionHeader {
    TenantId tenantId;
    std::string kind;
    std::optional<UserId> creatorId;
    std::optional<std::string> idempotencyKey;  ///< уникален в паре с kind
    std::optional<std::string> reference;
};

/**
 * @brief Транзакция журнала (неизменяема после создания)
 */
struct Transaction {
    TransactionId id = 0;
    TransactionHeader header;
    Timestamp createdAt;
};

/**
 * @brief Проводка: знаковая сумма по (транзакция, счёт, актив)
 */
struct LedgerEntry {
    EntryId id = 0;
    TransactionId transactionId = 0;
    AccountId accountId = 0;
    AssetId assetId = 0;
    Amount amount;
};

} // namespace ledger::domain
