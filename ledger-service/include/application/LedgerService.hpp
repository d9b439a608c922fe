#pragma once

#include "ports/input/ILedger.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IStorage.hpp"
#include "application/LedgerUnit.hpp"
#include "domain/events/TreasuryRefilledEvent.hpp"
#include "settings/LedgerSettings.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Ядро журнала: единицы работы, повторы, автопополнение казны
 *
 * Каждая единица работает в своей сессии хранилища:
 * 1. work(unit)
 * 2. проверка баланса транзакций
 * 3. commit
 * 4. публикация событий
 *
 * StorageConflict - повтор всей единицы (проверки баланса выполняются заново).
 * TreasuryRefillRequired - пополнение казны отдельной транзакцией и повтор.
 */
class LedgerService : public ports::input::ILedger {
public:
    LedgerService(std::shared_ptr<ports::output::IStorage> storage,
                  std::shared_ptr<ports::output::IEventPublisher> publisher,
                  std::shared_ptr<ports::output::IClock> clock,
                  std::shared_ptr<settings::LedgerSettings> settings)
        : storage_(std::move(storage))
        , publisher_(std::move(publisher))
        , clock_(std::move(clock))
        , settings_(std::move(settings))
    {}

    void transact(const ports::input::UnitOfWork& work) override {
        int conflicts = 0;
        int refills = 0;

        while (true) {
            try {
                runOnce(work);
                return;
            } catch (const domain::StorageConflict& e) {
                if (++conflicts > settings_->getMaxRetries()) {
                    std::cerr << "[LedgerService] Giving up after " << conflicts - 1
                              << " retries: " << e.what() << std::endl;
                    throw;
                }
                std::cout << "[LedgerService] Retry " << conflicts << " after conflict: "
                          << e.what() << std::endl;
            } catch (const TreasuryRefillRequired& e) {
                if (++refills > settings_->getMaxRefillRounds()) {
                    throw domain::InsufficientBalance(e.treasuryId, e.balance, e.required);
                }
                autoRefillTreasuryIfNeeded(e.treasuryId, e.assetId, e.tenantId, e.required);
            }
        }
    }

    domain::Amount balanceOf(domain::AccountId accountId, domain::AssetId assetId) override {
        domain::Amount balance;
        transact([&](ports::input::ILedgerUnit& unit) {
            balance = unit.balanceOf(accountId, assetId);
        });
        return balance;
    }

    bool autoRefillTreasuryIfNeeded(domain::AccountId treasuryId,
                                    domain::AssetId assetId,
                                    const domain::TenantId& tenantId,
                                    const std::optional<domain::Amount>& requiredAmount) override {
        bool refilled = false;
        const auto quantum = settings_->getRefillQuantum();

        transact([&](ports::input::ILedgerUnit& unit) {
            refilled = false;

            auto treasury = unit.requireAccount(treasuryId);
            if (treasury.type != domain::AccountType::TREASURY || treasury.tenantId != tenantId) {
                throw domain::AccountNotFound("treasury " + std::to_string(treasuryId) +
                                              " in tenant " + tenantId);
            }

            // Повторная проверка под блокировкой: параллельный вызов мог уже пополнить
            unit.session().accounts().lockAccount(treasuryId);
            auto balance = unit.balanceOf(treasuryId, assetId);
            bool needed = !balance.isPositive() || (requiredAmount && *requiredAmount > balance);
            if (!needed) {
                return;
            }

            auto mintId = unit.systemAccount(tenantId, domain::AccountType::MINT);
            domain::TransactionHeader header;
            header.tenantId = tenantId;
            header.kind = domain::kinds::AUTO_TREASURY_REFILL;
            header.reference = "balance " + balance.toString();

            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, mintId, assetId, -quantum);
            unit.postEntry(txId, treasuryId, assetId, quantum);

            auto event = std::make_unique<domain::TreasuryRefilledEvent>();
            event->tenantId = tenantId;
            event->treasuryAccountId = treasuryId;
            event->assetId = assetId;
            event->amount = quantum;
            event->balanceAfter = balance + quantum;
            event->transactionId = txId;
            unit.emit(std::move(event));
            refilled = true;
        });

        if (refilled) {
            std::cout << "[LedgerService] Treasury " << treasuryId << " refilled with "
                      << quantum << " of asset " << assetId << std::endl;
        }
        return refilled;
    }

    int64_t rebuildBalances() override {
        int64_t rows = 0;
        transact([&](ports::input::ILedgerUnit& unit) {
            rows = unit.session().journal().rebuildBalances();
        });
        std::cout << "[LedgerService] Rebuilt " << rows << " balance rows" << std::endl;
        return rows;
    }

    std::vector<domain::BalanceMismatch> verifyBalances() override {
        std::vector<domain::BalanceMismatch> mismatches;
        transact([&](ports::input::ILedgerUnit& unit) {
            mismatches = unit.session().journal().findBalanceMismatches();
        });
        for (const auto& m : mismatches) {
            std::cerr << "[LedgerService] Balance cache mismatch: account " << m.accountId
                      << " asset " << m.assetId << " cached " << m.cached
                      << " replayed " << m.replayed << std::endl;
        }
        return mismatches;
    }

private:
    std::shared_ptr<ports::output::IStorage> storage_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    void runOnce(const ports::input::UnitOfWork& work) {
        auto session = storage_->begin();
        LedgerUnit unit(*session, clock_->now());

        work(unit);

        try {
            unit.verify();
        } catch (const domain::UnbalancedTransaction& e) {
            std::cerr << "[LedgerService] FATAL unbalanced transaction " << e.transactionId()
                      << " asset " << e.assetId() << " residual " << e.residual()
                      << ", rolling back" << std::endl;
            throw;
        }

        auto events = unit.takeEvents();
        session->commit();

        for (const auto& event : events) {
            try {
                publisher_->publish(event->eventType, event->toJson());
            } catch (const std::exception& e) {
                std::cerr << "[LedgerService] Failed to publish " << event->eventType
                          << " (already committed): " << e.what() << std::endl;
            }
        }
    }
};

} // namespace ledger::application
