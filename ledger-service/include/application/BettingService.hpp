#pragma once

#include "ports/input/IBettingService.hpp"
#include "ports/input/ILedger.hpp"
#include "application/TransactionFactory.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace ledger::application {

/**
 * @brief Тотализатор
 *
 * Ставки - обычные транзакции user -> escrow. При расчёте escrow отдаёт
 * весь пул: победителям trunc(stake * odds), остаток в казну; если выплата
 * больше пула, разницу доплачивает казна.
 */
class BettingService : public ports::input::IBettingService {
public:
    explicit BettingService(std::shared_ptr<ports::input::ILedger> ledger)
        : ledger_(std::move(ledger))
    {}

    /**
     * @brief Коэффициент pool / targetStake
     *
     * Два знака HALF_EVEN, не меньше 1.10; 2.00 пока ставок нет.
     */
    static domain::Amount computeOdds(const domain::Amount& pool, const domain::Amount& targetStake) {
        static const domain::Amount kDefault = domain::Amount::parse("2.00");
        static const domain::Amount kMinimum = domain::Amount::parse("1.10");

        if (pool.isZero() || targetStake.isZero()) {
            return kDefault;
        }
        auto odds = pool.divide(targetStake, 2, domain::RoundingMode::HALF_EVEN);
        return odds < kMinimum ? kMinimum : odds;
    }

    int64_t createEvent(const domain::TenantId& tenantId,
                        const std::string& title,
                        const std::string& symbol) override {
        int64_t id = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto& store = unit.session().betting();
            if (store.findActiveBettingEvent(tenantId)) {
                throw domain::InvalidState("Tenant " + tenantId + " already has an active betting event");
            }
            auto asset = unit.requireAsset(tenantId, symbol);

            domain::BettingEvent event;
            event.tenantId = tenantId;
            event.title = title;
            event.assetId = asset.id;
            event.active = true;
            event.createdAt = unit.now();
            id = store.insertBettingEvent(event);
        });
        std::cout << "[BettingService] Event " << id << " '" << title << "' opened in " << tenantId << std::endl;
        return id;
    }

    void addPlayer(const domain::TenantId& tenantId, const domain::UserId& playerId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            unit.session().betting().addBettingPlayer(event.id, playerId);
        });
    }

    void removePlayer(const domain::TenantId& tenantId, const domain::UserId& playerId) override {
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            auto& store = unit.session().betting();
            for (const auto& bet : store.listBets(event.id)) {
                if (bet.targetId == playerId) {
                    throw domain::InvalidState("Player " + playerId + " already has bets");
                }
            }
            if (!store.removeBettingPlayer(event.id, playerId)) {
                throw domain::NotFound("player " + playerId + " in event " + std::to_string(event.id));
            }
        });
    }

    domain::Bet placeBet(const domain::TenantId& tenantId,
                         const domain::UserId& bettorId,
                         const domain::UserId& targetId,
                         const domain::Amount& stake) override {
        if (!stake.isPositive() || !stake.isQuantized(0)) {
            throw domain::InvalidAmount("stake must be a positive whole amount, got " + stake.toString());
        }

        domain::Bet bet;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            auto& store = unit.session().betting();
            if (!isPlayer(store.listBettingPlayers(event.id), targetId)) {
                throw domain::NotFound("player " + targetId + " in event " + std::to_string(event.id));
            }

            ports::input::TransactionRequest request;
            request.header.tenantId = tenantId;
            request.header.kind = domain::kinds::BET;
            request.header.creatorId = bettorId;
            request.header.reference = "event " + std::to_string(event.id) + " on " + targetId;
            request.assetId = event.assetId;
            request.postings = {
                {unit.userAccount(tenantId, bettorId), -stake},
                {unit.systemAccount(tenantId, domain::AccountType::ESCROW), stake}
            };

            bet = domain::Bet();
            bet.eventId = event.id;
            bet.bettorId = bettorId;
            bet.targetId = targetId;
            bet.stake = stake;
            bet.transactionId = TransactionFactory::postWithin(unit, request);
            bet.id = store.insertBet(bet);
        });

        std::cout << "[BettingService] " << bettorId << " bet " << stake << " on " << targetId
                  << " (event " << bet.eventId << ")" << std::endl;
        return bet;
    }

    std::vector<domain::PlayerOdds> odds(const domain::TenantId& tenantId) override {
        std::vector<domain::PlayerOdds> result;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            auto& store = unit.session().betting();
            auto bets = store.listBets(event.id);

            domain::Amount pool;
            std::map<domain::UserId, domain::Amount> staked;
            for (const auto& bet : bets) {
                pool += bet.stake;
                staked[bet.targetId] += bet.stake;
            }

            result.clear();
            for (const auto& player : store.listBettingPlayers(event.id)) {
                domain::PlayerOdds o;
                o.playerId = player;
                o.staked = staked[player];
                o.odds = computeOdds(pool, o.staked);
                result.push_back(o);
            }
        });
        return result;
    }

    domain::SettlementResult settle(const domain::TenantId& tenantId,
                                    const domain::UserId& winnerId) override {
        domain::SettlementResult result;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            auto& store = unit.session().betting();
            auto bets = store.listBets(event.id);

            result = domain::SettlementResult();
            domain::Amount winningStake;
            for (const auto& bet : bets) {
                result.pool += bet.stake;
                if (bet.targetId == winnerId) {
                    winningStake += bet.stake;
                }
            }
            if (winningStake.isZero()) {
                throw domain::InvalidState("No bets on " + winnerId + "; cancel the event instead");
            }
            result.odds = computeOdds(result.pool, winningStake);

            ports::input::TransactionRequest request;
            request.header.tenantId = tenantId;
            request.header.kind = domain::kinds::BET_PAYOUT;
            request.header.reference = "event " + std::to_string(event.id) + " won by " + winnerId;
            request.assetId = event.assetId;
            request.postings.push_back({unit.systemAccount(tenantId, domain::AccountType::ESCROW), -result.pool});

            for (const auto& bet : bets) {
                if (bet.targetId != winnerId) {
                    continue;
                }
                auto amount = bet.stake.multiply(result.odds, 0, domain::RoundingMode::DOWN);
                result.payouts.push_back({bet.bettorId, bet.stake, amount});
                result.totalPaid += amount;
                request.postings.push_back({unit.userAccount(tenantId, bet.bettorId), amount});
            }

            result.treasuryDelta = result.pool - result.totalPaid;
            if (!result.treasuryDelta.isZero()) {
                request.postings.push_back({unit.systemAccount(tenantId, domain::AccountType::TREASURY),
                                            result.treasuryDelta});
            }

            result.transactionId = TransactionFactory::postWithin(unit, request);
            store.closeBettingEvent(event.id, winnerId);
        });

        std::cout << "[BettingService] Settled for " << winnerId << " in " << tenantId
                  << ": pool " << result.pool << ", odds " << result.odds
                  << ", paid " << result.totalPaid << std::endl;
        return result;
    }

    int cancel(const domain::TenantId& tenantId) override {
        int refunded = 0;
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            auto event = requireActive(unit, tenantId);
            auto& store = unit.session().betting();
            auto bets = store.listBets(event.id);

            refunded = static_cast<int>(bets.size());
            if (!bets.empty()) {
                ports::input::TransactionRequest request;
                request.header.tenantId = tenantId;
                request.header.kind = domain::kinds::BET_REFUND;
                request.header.reference = "event " + std::to_string(event.id) + " cancelled";
                request.assetId = event.assetId;

                domain::Amount pool;
                for (const auto& bet : bets) {
                    pool += bet.stake;
                    request.postings.push_back({unit.userAccount(tenantId, bet.bettorId), bet.stake});
                }
                request.postings.push_back({unit.systemAccount(tenantId, domain::AccountType::ESCROW), -pool});
                TransactionFactory::postWithin(unit, request);
            }
            store.closeBettingEvent(event.id, std::nullopt);
        });

        std::cout << "[BettingService] Event cancelled in " << tenantId << ", refunded "
                  << refunded << " bets" << std::endl;
        return refunded;
    }

private:
    std::shared_ptr<ports::input::ILedger> ledger_;

    static domain::BettingEvent requireActive(ports::input::ILedgerUnit& unit, const domain::TenantId& tenantId) {
        auto event = unit.session().betting().findActiveBettingEvent(tenantId);
        if (!event) {
            throw domain::NotFound("active betting event in tenant " + tenantId);
        }
        return *event;
    }

    static bool isPlayer(const std::vector<domain::UserId>& players, const domain::UserId& userId) {
        for (const auto& p : players) {
            if (p == userId) return true;
        }
        return false;
    }
};

} // namespace ledger::application
