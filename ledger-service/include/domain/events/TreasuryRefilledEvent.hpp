#pragma once

#include "DomainEvent.hpp"
#include "domain/Amount.hpp"
#include "domain/Types.hpp"

namespace ledger::domain {

/**
 * @brief Событие: казна пополнена из mint
 */
struct TreasuryRefilledEvent : public DomainEvent {
    TenantId tenantId;
    AccountId treasuryAccountId = 0;
    AssetId assetId = 0;
    Amount amount;
    Amount balanceAfter;
    TransactionId transactionId = 0;

    TreasuryRefilledEvent() : DomainEvent("treasury.refilled") {}

    std::string toJson() const override;
};

} // namespace ledger::domain
