#pragma once

#include "domain/Asset.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Реестр валют тенанта
 */
class IAssetRegistry {
public:
    virtual ~IAssetRegistry() = default;

    /// @throws DuplicateAsset
    virtual domain::AssetId createAsset(const domain::TenantId& tenantId,
                                        const std::string& symbol,
                                        const std::string& name,
                                        int decimals) = 0;

    /// @throws AssetNotFound
    virtual domain::Asset getAsset(const domain::TenantId& tenantId, const std::string& symbol) = 0;

    virtual std::vector<domain::Asset> listAssets(const domain::TenantId& tenantId) = 0;

    /// Каскадное удаление в одной единице работы; @throws AssetNotFound
    virtual domain::AssetDeletionReport deleteAsset(const domain::TenantId& tenantId,
                                                    const std::string& symbol) = 0;
};

} // namespace ledger::ports::input
