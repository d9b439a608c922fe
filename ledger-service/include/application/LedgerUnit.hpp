#pragma once

#include "ports/input/ILedgerUnit.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/TransactionCommittedEvent.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ledger::application {

/**
 * @brief Сигнал LedgerService: казну нужно пополнить и повторить единицу
 */
class TreasuryRefillRequired : public std::runtime_error {
public:
    TreasuryRefillRequired(domain::AccountId treasuryId, domain::AssetId assetId,
                           domain::TenantId tenantId, domain::Amount balance, domain::Amount required)
        : std::runtime_error("Treasury refill required")
        , treasuryId(treasuryId)
        , assetId(assetId)
        , tenantId(std::move(tenantId))
        , balance(std::move(balance))
        , required(std::move(required)) {}

    domain::AccountId treasuryId;
    domain::AssetId assetId;
    domain::TenantId tenantId;
    domain::Amount balance;
    domain::Amount required;
};

/**
 * @brief Единица работы поверх одной сессии хранилища
 *
 * Ведёт учёт проводок открытых транзакций и перед фиксацией проверяет:
 * - каждая транзакция сходится в ноль по каждому активу
 * - ни один обычный счёт, с которого списывали, не ушёл в минус
 */
class LedgerUnit : public ports::input::ILedgerUnit {
public:
    LedgerUnit(ports::output::IStorageSession& session, domain::Timestamp now)
        : session_(session)
        , now_(now)
    {}

    ports::output::IStorageSession& session() override { return session_; }
    const domain::Timestamp& now() const override { return now_; }

    domain::TransactionId newTransaction(const domain::TransactionHeader& header) override {
        auto txId = session_.journal().insertTransaction(header, now_);
        if (!txId) {
            auto existing = session_.journal().findTransactionByKey(header.kind, header.idempotencyKey.value_or(""));
            throw domain::DuplicateTransaction(header.kind, header.idempotencyKey.value_or(""),
                                               existing ? existing->id : 0);
        }

        OpenTransaction open;
        open.header = header;
        open_.emplace(*txId, std::move(open));
        order_.push_back(*txId);
        return *txId;
    }

    void postEntry(domain::TransactionId txId,
                   domain::AccountId accountId,
                   domain::AssetId assetId,
                   const domain::Amount& amount) override {
        auto it = open_.find(txId);
        if (it == open_.end()) {
            throw domain::InvalidState("Transaction " + std::to_string(txId) +
                                       " was not opened in this unit of work");
        }

        auto asset = requireAsset(assetId);
        auto account = requireAccount(accountId);
        const auto& tenantId = it->second.header.tenantId;
        if (asset.tenantId != tenantId || account.tenantId != tenantId) {
            throw domain::InvalidState("Posting crosses tenant boundary in transaction " +
                                       std::to_string(txId));
        }
        if (amount.isZero()) {
            throw domain::InvalidAmount("zero posting");
        }
        if (!amount.isQuantized(asset.decimals)) {
            throw domain::InvalidAmount(amount.toString() + " exceeds " +
                                        std::to_string(asset.decimals) + " decimals of " + asset.symbol);
        }

        domain::LedgerEntry entry;
        entry.transactionId = txId;
        entry.accountId = accountId;
        entry.assetId = assetId;
        entry.amount = amount;
        entry.id = session_.journal().insertEntry(entry);

        it->second.entries.push_back(entry);
        it->second.sums[assetId] += amount;
        if (amount.isNegative() && !domain::isOverdraftExempt(account.type)) {
            debited_.insert({accountId, assetId});
        }
    }

    domain::Amount balanceOf(domain::AccountId accountId, domain::AssetId assetId) override {
        return session_.journal().cachedBalance(accountId, assetId);
    }

    void requireFunds(domain::AccountId accountId, domain::AssetId assetId,
                      const domain::Amount& amount) override {
        auto account = requireAccount(accountId);
        if (domain::isOverdraftExempt(account.type)) {
            return;
        }
        session_.accounts().lockAccount(accountId);
        auto balance = balanceOf(accountId, assetId);
        if (balance < amount) {
            throw domain::InsufficientBalance(accountId, balance, amount);
        }
    }

    void ensureTreasuryCovers(domain::AccountId treasuryId, domain::AssetId assetId,
                              const domain::Amount& amount) override {
        auto treasury = requireAccount(treasuryId);
        if (treasury.type != domain::AccountType::TREASURY) {
            throw domain::InvalidState("Account " + treasury.name + " is not a treasury");
        }
        session_.accounts().lockAccount(treasuryId);
        auto balance = balanceOf(treasuryId, assetId);
        if (!balance.isPositive() || amount > balance) {
            throw TreasuryRefillRequired(treasuryId, assetId, treasury.tenantId, balance, amount);
        }
    }

    domain::Asset requireAsset(domain::AssetId assetId) override {
        auto it = assets_.find(assetId);
        if (it != assets_.end()) {
            return it->second;
        }
        auto asset = session_.assets().findAssetById(assetId);
        if (!asset) {
            throw domain::AssetNotFound("id " + std::to_string(assetId));
        }
        assets_[assetId] = *asset;
        return *asset;
    }

    domain::Asset requireAsset(const domain::TenantId& tenantId, const std::string& symbol) override {
        auto normalized = domain::Asset::normalizeSymbol(symbol);
        auto asset = session_.assets().findAssetBySymbol(tenantId, normalized);
        if (!asset) {
            throw domain::AssetNotFound(normalized + " in tenant " + tenantId);
        }
        assets_[asset->id] = *asset;
        return *asset;
    }

    domain::Account requireAccount(domain::AccountId accountId) override {
        auto it = accounts_.find(accountId);
        if (it != accounts_.end()) {
            return it->second;
        }
        auto account = session_.accounts().findAccountById(accountId);
        if (!account) {
            throw domain::AccountNotFound("id " + std::to_string(accountId));
        }
        accounts_[accountId] = *account;
        return *account;
    }

    domain::AccountId systemAccount(const domain::TenantId& tenantId, domain::AccountType type) override {
        auto name = domain::Account::systemName(type, tenantId);
        auto account = session_.accounts().findAccountByName(name);
        if (!account) {
            throw domain::AccountNotFound(name);
        }
        accounts_[account->id] = *account;
        return account->id;
    }

    domain::AccountId userAccount(const domain::TenantId& tenantId, const domain::UserId& userId) override {
        auto name = domain::Account::userName(userId, tenantId);
        auto existing = session_.accounts().findAccountByName(name);
        if (existing) {
            return existing->id;
        }

        domain::Account account;
        account.ownerId = userId;
        account.tenantId = tenantId;
        account.name = name;
        account.type = domain::AccountType::USER;
        session_.accounts().insertAccountIgnore(account);

        auto created = session_.accounts().findAccountByName(name);
        if (!created) {
            throw domain::AccountNotFound(name);
        }
        return created->id;
    }

    void emit(std::unique_ptr<domain::DomainEvent> event) override {
        events_.push_back(std::move(event));
    }

    /**
     * @brief Проверки перед фиксацией
     * @throws UnbalancedTransaction, InsufficientBalance
     */
    void verify() {
        for (const auto& [txId, open] : open_) {
            for (const auto& [assetId, sum] : open.sums) {
                if (!sum.isZero()) {
                    throw domain::UnbalancedTransaction(txId, assetId, sum);
                }
            }
        }
        for (const auto& [accountId, assetId] : debited_) {
            auto balance = balanceOf(accountId, assetId);
            if (balance.isNegative()) {
                throw domain::InsufficientBalance(accountId, balance, domain::Amount());
            }
        }
    }

    /// События для публикации: сначала по одной на транзакцию, затем добавленные через emit()
    std::vector<std::unique_ptr<domain::DomainEvent>> takeEvents() {
        std::vector<std::unique_ptr<domain::DomainEvent>> result;
        for (auto txId : order_) {
            auto& open = open_.at(txId);
            auto event = std::make_unique<domain::TransactionCommittedEvent>();
            event->transactionId = txId;
            event->header = open.header;
            event->entries = open.entries;
            result.push_back(std::move(event));
        }
        for (auto& e : events_) {
            result.push_back(std::move(e));
        }
        events_.clear();
        return result;
    }

private:
    struct OpenTransaction {
        domain::TransactionHeader header;
        std::vector<domain::LedgerEntry> entries;
        std::map<domain::AssetId, domain::Amount> sums;
    };

    ports::output::IStorageSession& session_;
    domain::Timestamp now_;
    std::map<domain::TransactionId, OpenTransaction> open_;
    std::vector<domain::TransactionId> order_;
    std::set<std::pair<domain::AccountId, domain::AssetId>> debited_;
    std::map<domain::AssetId, domain::Asset> assets_;
    std::map<domain::AccountId, domain::Account> accounts_;
    std::vector<std::unique_ptr<domain::DomainEvent>> events_;
};

} // namespace ledger::application
