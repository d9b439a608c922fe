#pragma once

#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

struct Posting {
    domain::AccountId accountId = 0;
    domain::Amount amount;
};

/**
 * @brief Одно экономическое действие: одна транзакция, сбалансированные проводки
 */
struct TransactionRequest {
    domain::TransactionHeader header;
    domain::AssetId assetId = 0;
    std::vector<Posting> postings;
};

struct TransactionReceipt {
    domain::TransactionId transactionId = 0;
    bool replayed = false;   ///< повтор по idempotencyKey, ничего не записано
};

class ITransactionFactory {
public:
    virtual ~ITransactionFactory() = default;

    /**
     * @brief Провести набор проводок одной транзакцией
     *
     * Списания с обычных счетов проверяются на достаточность средств,
     * списания с казны - на покрытие (с автопополнением).
     */
    virtual TransactionReceipt post(const TransactionRequest& request) = 0;

    /// Перевод между участниками; сумма усекается до точности актива
    virtual TransactionReceipt transfer(const domain::TenantId& tenantId,
                                        const domain::UserId& fromUser,
                                        const domain::UserId& toUser,
                                        const std::string& symbol,
                                        const domain::Amount& amount,
                                        const std::optional<std::string>& reference = std::nullopt,
                                        const std::optional<std::string>& idempotencyKey = std::nullopt) = 0;

    /// Выдача из казны
    virtual TransactionReceipt issue(const domain::TenantId& tenantId,
                                     const std::optional<domain::UserId>& creator,
                                     const domain::UserId& toUser,
                                     const std::string& symbol,
                                     const domain::Amount& amount,
                                     const std::optional<std::string>& idempotencyKey = std::nullopt) = 0;

    /// Изъятие из обращения на счёт burn
    virtual TransactionReceipt burn(const domain::TenantId& tenantId,
                                    const domain::UserId& fromUser,
                                    const std::string& symbol,
                                    const domain::Amount& amount) = 0;
};

} // namespace ledger::ports::input
