#pragma once

#include "ports/input/IAssetRegistry.hpp"
#include "ports/input/ILedger.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/AssetDeletedEvent.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

class AssetRegistry : public ports::input::IAssetRegistry {
public:
    explicit AssetRegistry(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    domain::AssetId createAsset(const domain::TenantId& tenantId,
                                const std::string& symbol,
                                const std::string& name,
                                int decimals) override {
        if (decimals < 0 || decimals > domain::Amount::kMaxDecimals) {
            throw domain::InvalidAmount("decimals must be in [0, 8], got " + std::to_string(decimals));
        }

        domain::Asset asset;
        asset.tenantId = tenantId;
        asset.symbol = domain::Asset::normalizeSymbol(symbol);
        asset.name = name;
        asset.decimals = decimals;

        domain::AssetId id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto inserted = unit.session().assets().insertAsset(asset);
            if (!inserted) {
                throw domain::DuplicateAsset(tenantId, asset.symbol);
            }
            id = *inserted;
        });

        std::cout << "[AssetRegistry] Created " << asset.symbol << " (id=" << id
                  << ", decimals=" << decimals << ") in tenant " << tenantId << std::endl;
        return id;
    }

    domain::Asset getAsset(const domain::TenantId& tenantId, const std::string& symbol) override {
        domain::Asset asset;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            asset = unit.requireAsset(tenantId, symbol);
        });
        return asset;
    }

    std::vector<domain::Asset> listAssets(const domain::TenantId& tenantId) override {
        std::vector<domain::Asset> assets;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            assets = unit.session().assets().listAssets(tenantId);
        });
        return assets;
    }

    domain::AssetDeletionReport deleteAsset(const domain::TenantId& tenantId,
                                            const std::string& symbol) override {
        domain::AssetDeletionReport report;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto asset = unit.requireAsset(tenantId, symbol);
            report = unit.session().assets().deleteAssetCascade(asset.id);

            auto event = std::make_unique<domain::AssetDeletedEvent>();
            event->tenantId = tenantId;
            event->symbol = asset.symbol;
            event->report = report;
            unit.emit(std::move(event));
        });

        std::cout << "[AssetRegistry] Deleted " << domain::Asset::normalizeSymbol(symbol)
                  << " from tenant " << tenantId << ": " << report.ledgerEntries
                  << " entries, " << report.rewardClaims << " claims" << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;
};

} // namespace ledger::application
