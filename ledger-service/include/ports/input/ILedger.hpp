#pragma once

#include "ILedgerUnit.hpp"
#include "domain/Balance.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace ledger::ports::input {

using UnitOfWork = std::function<void(ILedgerUnit&)>;

/**
 * @brief Ядро двойной записи
 */
class ILedger {
public:
    virtual ~ILedger() = default;

    /**
     * @brief Выполнить единицу работы атомарно
     *
     * StorageConflict повторяется ограниченное число раз,
     * затем пробрасывается вызывающему.
     */
    virtual void transact(const UnitOfWork& work) = 0;

    virtual domain::Amount balanceOf(domain::AccountId accountId, domain::AssetId assetId) = 0;

    /**
     * @brief Пополнить казну, если balance <= 0 или requiredAmount > balance
     *
     * Пополнение фиксируется отдельно от любой внешней операции.
     * @return true, если пополнение выполнено
     */
    virtual bool autoRefillTreasuryIfNeeded(domain::AccountId treasuryId,
                                            domain::AssetId assetId,
                                            const domain::TenantId& tenantId,
                                            const std::optional<domain::Amount>& requiredAmount) = 0;

    /// Пересобрать кэш балансов из проводок
    virtual int64_t rebuildBalances() = 0;
    virtual std::vector<domain::BalanceMismatch> verifyBalances() = 0;
};

} // namespace ledger::ports::input
