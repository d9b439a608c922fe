#pragma once

#include "DomainEvent.hpp"
#include "domain/Asset.hpp"

namespace ledger::domain {

/**
 * @brief Событие: актив удалён со всеми зависимыми строками
 */
struct AssetDeletedEvent : public DomainEvent {
    TenantId tenantId;
    std::string symbol;
    AssetDeletionReport report;

    AssetDeletedEvent() : DomainEvent("asset.deleted") {}

    std::string toJson() const override;
};

} // namespace ledger::domain
