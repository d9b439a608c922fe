#pragma once

#include "ports/output/IStorage.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <tuple>

namespace ledger::adapters::secondary {

/**
 * @brief Хранилище в памяти
 *
 * Сессия держит общий мьютекс всё время жизни и работает с копией
 * состояния; commit() подменяет состояние целиком. Поэтому все сессии
 * строго последовательны (эквивалент SERIALIZABLE без конфликтов).
 *
 * failNextCommits(n) заставляет n следующих commit() бросить
 * StorageConflict - для проверки повторов.
 */
class InMemoryStorage : public ports::output::IStorage {
public:
    struct State {
        int64_t nextId = 1;

        std::map<domain::AssetId, domain::Asset> assets;
        std::map<domain::AccountId, domain::Account> accounts;
        std::map<std::string, domain::AccountId> accountsByName;
        std::map<domain::TransactionId, domain::Transaction> transactions;
        std::map<std::pair<std::string, std::string>, domain::TransactionId> transactionsByKey;
        std::map<domain::EntryId, domain::LedgerEntry> entries;
        std::map<std::pair<domain::AccountId, domain::AssetId>, domain::Amount> balances;

        std::map<std::tuple<domain::TenantId, domain::UserId, domain::AssetId>, domain::BankAccount> bankAccounts;
        std::map<int64_t, domain::BankTransaction> bankTransactions;

        std::map<int64_t, domain::AutoRewardConfig> rewardConfigs;
        std::map<int64_t, domain::AutoRewardClaim> rewardClaims;

        std::map<int64_t, domain::RolePanel> panels;
        std::map<int64_t, domain::RolePlan> plans;
        std::map<int64_t, domain::RolePurchase> purchases;

        std::map<int64_t, domain::AllowanceConfig> allowanceConfigs;
        std::map<int64_t, domain::AllowanceRecord> allowanceRecords;

        std::map<int64_t, domain::VcEarningRate> vcRates;
        std::map<std::pair<domain::TenantId, domain::UserId>, domain::VcSession> vcSessions;
        std::map<std::tuple<domain::TenantId, domain::UserId, domain::AssetId, std::string>, domain::VcDailyTotal> vcDaily;

        std::map<int64_t, domain::BettingEvent> bettingEvents;
        std::set<std::pair<int64_t, domain::UserId>> bettingPlayers;
        std::map<int64_t, domain::Bet> bets;
    };

    std::unique_ptr<ports::output::IStorageSession> begin() override;

    /// Копия зафиксированного состояния (для тестов и отчётов)
    State snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void failNextCommits(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        conflictsToInject_ = count;
    }

private:
    friend class InMemorySession;

    mutable std::mutex mutex_;
    State state_;
    int conflictsToInject_ = 0;
};

class InMemorySession : public ports::output::IStorageSession,
                        public ports::output::IAssetStore,
                        public ports::output::IAccountStore,
                        public ports::output::IJournalStore,
                        public ports::output::IBankStore,
                        public ports::output::IAutoRewardStore,
                        public ports::output::IRoleShopStore,
                        public ports::output::IAllowanceStore,
                        public ports::output::IVcStore,
                        public ports::output::IBettingStore {
public:
    explicit InMemorySession(InMemoryStorage& storage)
        : storage_(storage)
        , lock_(storage.mutex_)
        , s_(storage.state_)
    {}

    ports::output::IAssetStore& assets() override { return *this; }
    ports::output::IAccountStore& accounts() override { return *this; }
    ports::output::IJournalStore& journal() override { return *this; }
    ports::output::IBankStore& bank() override { return *this; }
    ports::output::IAutoRewardStore& rewards() override { return *this; }
    ports::output::IRoleShopStore& roles() override { return *this; }
    ports::output::IAllowanceStore& allowances() override { return *this; }
    ports::output::IVcStore& voice() override { return *this; }
    ports::output::IBettingStore& betting() override { return *this; }

    void commit() override {
        if (committed_) {
            throw domain::InvalidState("Session already committed");
        }
        if (storage_.conflictsToInject_ > 0) {
            --storage_.conflictsToInject_;
            throw domain::StorageConflict("injected commit conflict");
        }
        storage_.state_ = std::move(s_);
        committed_ = true;
    }

    // ========================================================================
    // ASSETS
    // ========================================================================

    std::optional<domain::AssetId> insertAsset(const domain::Asset& asset) override {
        if (findAssetBySymbol(asset.tenantId, asset.symbol)) {
            return std::nullopt;
        }
        domain::Asset stored = asset;
        stored.id = s_.nextId++;
        s_.assets[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::Asset> findAssetBySymbol(const domain::TenantId& tenantId,
                                                   const std::string& symbol) override {
        for (const auto& [id, a] : s_.assets) {
            if (a.tenantId == tenantId && a.symbol == symbol) {
                return a;
            }
        }
        return std::nullopt;
    }

    std::optional<domain::Asset> findAssetById(domain::AssetId id) override {
        auto it = s_.assets.find(id);
        if (it == s_.assets.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Asset> listAssets(const domain::TenantId& tenantId) override {
        std::vector<domain::Asset> result;
        for (const auto& [id, a] : s_.assets) {
            if (a.tenantId == tenantId) result.push_back(a);
        }
        return result;
    }

    domain::AssetDeletionReport deleteAssetCascade(domain::AssetId assetId) override {
        domain::AssetDeletionReport r;
        r.assetId = assetId;

        std::set<domain::TransactionId> touched;
        r.ledgerEntries = eraseIf(s_.entries, [&](const domain::LedgerEntry& e) {
            if (e.assetId == assetId) touched.insert(e.transactionId);
            return e.assetId == assetId;
        });
        for (auto txId : touched) {
            bool empty = std::none_of(s_.entries.begin(), s_.entries.end(),
                                      [&](const auto& kv) { return kv.second.transactionId == txId; });
            if (empty) {
                eraseTransaction(txId);
                ++r.transactions;
            }
        }
        for (auto it = s_.balances.begin(); it != s_.balances.end();) {
            if (it->first.second == assetId) { it = s_.balances.erase(it); ++r.balanceRows; }
            else ++it;
        }

        std::set<int64_t> configIds;
        r.rewardConfigs = eraseIf(s_.rewardConfigs, [&](const domain::AutoRewardConfig& c) {
            if (c.assetId == assetId) configIds.insert(c.id);
            return c.assetId == assetId;
        });
        r.rewardClaims = eraseIf(s_.rewardClaims, [&](const domain::AutoRewardClaim& c) {
            return configIds.count(c.configId) > 0;
        });

        for (auto it = s_.bankAccounts.begin(); it != s_.bankAccounts.end();) {
            if (it->second.assetId == assetId) { it = s_.bankAccounts.erase(it); ++r.bankAccounts; }
            else ++it;
        }
        r.bankTransactions = eraseIf(s_.bankTransactions, [&](const domain::BankTransaction& t) {
            return t.assetId == assetId;
        });
        std::set<int64_t> planIds;
        r.rolePlans = eraseIf(s_.plans, [&](const domain::RolePlan& p) {
            if (p.assetId == assetId) planIds.insert(p.id);
            return p.assetId == assetId;
        });
        r.rolePurchases = eraseIf(s_.purchases, [&](const domain::RolePurchase& p) {
            return planIds.count(p.planId) > 0 || touched.count(p.transactionId) > 0;
        });
        r.allowanceConfigs = eraseIf(s_.allowanceConfigs, [&](const domain::AllowanceConfig& c) {
            return c.assetId == assetId;
        });
        r.allowanceRecords = eraseIf(s_.allowanceRecords, [&](const domain::AllowanceRecord& rec) {
            return rec.assetId == assetId;
        });
        r.vcRates = eraseIf(s_.vcRates, [&](const domain::VcEarningRate& rate) { return rate.assetId == assetId; });
        for (auto it = s_.vcDaily.begin(); it != s_.vcDaily.end();) {
            if (it->second.assetId == assetId) { it = s_.vcDaily.erase(it); ++r.vcDailyTotals; }
            else ++it;
        }

        std::set<int64_t> eventIds;
        r.bettingEvents = eraseIf(s_.bettingEvents, [&](const domain::BettingEvent& e) {
            if (e.assetId == assetId) eventIds.insert(e.id);
            return e.assetId == assetId;
        });
        eraseIf(s_.bets, [&](const domain::Bet& b) { return eventIds.count(b.eventId) > 0; });
        for (auto it = s_.bettingPlayers.begin(); it != s_.bettingPlayers.end();) {
            if (eventIds.count(it->first)) it = s_.bettingPlayers.erase(it);
            else ++it;
        }

        s_.assets.erase(assetId);
        return r;
    }

    // ========================================================================
    // ACCOUNTS
    // ========================================================================

    void insertAccountIgnore(const domain::Account& account) override {
        if (s_.accountsByName.count(account.name)) {
            return;
        }
        domain::Account stored = account;
        stored.id = s_.nextId++;
        s_.accounts[stored.id] = stored;
        s_.accountsByName[stored.name] = stored.id;
    }

    std::optional<domain::Account> findAccountByName(const std::string& name) override {
        auto it = s_.accountsByName.find(name);
        if (it == s_.accountsByName.end()) return std::nullopt;
        return s_.accounts.at(it->second);
    }

    std::optional<domain::Account> findAccountById(domain::AccountId id) override {
        auto it = s_.accounts.find(id);
        if (it == s_.accounts.end()) return std::nullopt;
        return it->second;
    }

    void lockAccount(domain::AccountId) override {
        // сессия уже исключительна
    }

    // ========================================================================
    // JOURNAL
    // ========================================================================

    std::optional<domain::TransactionId> insertTransaction(const domain::TransactionHeader& header,
                                                           const domain::Timestamp& createdAt) override {
        if (header.idempotencyKey) {
            auto key = std::make_pair(header.kind, *header.idempotencyKey);
            if (s_.transactionsByKey.count(key)) {
                return std::nullopt;
            }
        }
        domain::Transaction tx;
        tx.id = s_.nextId++;
        tx.header = header;
        tx.createdAt = createdAt;
        s_.transactions[tx.id] = tx;
        if (header.idempotencyKey) {
            s_.transactionsByKey[{header.kind, *header.idempotencyKey}] = tx.id;
        }
        return tx.id;
    }

    std::optional<domain::Transaction> findTransaction(domain::TransactionId id) override {
        auto it = s_.transactions.find(id);
        if (it == s_.transactions.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Transaction> findTransactionByKey(const std::string& kind,
                                                            const std::string& idempotencyKey) override {
        auto it = s_.transactionsByKey.find({kind, idempotencyKey});
        if (it == s_.transactionsByKey.end()) return std::nullopt;
        return s_.transactions.at(it->second);
    }

    std::vector<domain::Transaction> listTransactions(const domain::TenantId& tenantId,
                                                      const std::string& kind) override {
        std::vector<domain::Transaction> result;
        for (const auto& [id, tx] : s_.transactions) {
            if (tx.header.tenantId == tenantId && tx.header.kind == kind) result.push_back(tx);
        }
        return result;
    }

    domain::EntryId insertEntry(const domain::LedgerEntry& entry) override {
        domain::LedgerEntry stored = entry;
        stored.id = s_.nextId++;
        s_.entries[stored.id] = stored;
        s_.balances[{entry.accountId, entry.assetId}] += entry.amount;
        return stored.id;
    }

    std::vector<domain::LedgerEntry> entriesFor(domain::TransactionId txId) override {
        std::vector<domain::LedgerEntry> result;
        for (const auto& [id, e] : s_.entries) {
            if (e.transactionId == txId) result.push_back(e);
        }
        return result;
    }

    domain::Amount cachedBalance(domain::AccountId accountId, domain::AssetId assetId) override {
        auto it = s_.balances.find({accountId, assetId});
        return it == s_.balances.end() ? domain::Amount() : it->second;
    }

    domain::Amount sumEntries(domain::AccountId accountId, domain::AssetId assetId) override {
        domain::Amount sum;
        for (const auto& [id, e] : s_.entries) {
            if (e.accountId == accountId && e.assetId == assetId) sum += e.amount;
        }
        return sum;
    }

    int64_t rebuildBalances() override {
        s_.balances = replay();
        return static_cast<int64_t>(s_.balances.size());
    }

    std::vector<domain::BalanceMismatch> findBalanceMismatches() override {
        auto replayed = replay();
        std::vector<domain::BalanceMismatch> result;
        std::set<std::pair<domain::AccountId, domain::AssetId>> keys;
        for (const auto& [k, v] : s_.balances) keys.insert(k);
        for (const auto& [k, v] : replayed) keys.insert(k);

        for (const auto& key : keys) {
            auto cached = s_.balances.count(key) ? s_.balances.at(key) : domain::Amount();
            auto actual = replayed.count(key) ? replayed.at(key) : domain::Amount();
            if (cached != actual) {
                result.push_back({key.first, key.second, cached, actual});
            }
        }
        return result;
    }

    /// Для тестов: испортить кэш, чтобы проверить пересборку
    void overwriteCachedBalance(domain::AccountId accountId, domain::AssetId assetId, const domain::Amount& value) {
        s_.balances[{accountId, assetId}] = value;
    }

    // ========================================================================
    // BANK
    // ========================================================================

    std::optional<domain::BankAccount> findBankAccount(const domain::TenantId& tenantId,
                                                       const domain::UserId& userId,
                                                       domain::AssetId assetId) override {
        auto it = s_.bankAccounts.find({tenantId, userId, assetId});
        if (it == s_.bankAccounts.end()) return std::nullopt;
        return it->second;
    }

    void saveBankAccount(const domain::BankAccount& account) override {
        s_.bankAccounts[{account.tenantId, account.userId, account.assetId}] = account;
    }

    int64_t insertBankTransaction(const domain::BankTransaction& tx) override {
        domain::BankTransaction stored = tx;
        stored.id = s_.nextId++;
        s_.bankTransactions[stored.id] = stored;
        return stored.id;
    }

    std::vector<domain::BankTransaction> listBankTransactions(const domain::TenantId& tenantId,
                                                              const domain::UserId& userId,
                                                              domain::AssetId assetId,
                                                              int limit) override {
        std::vector<domain::BankTransaction> result;
        for (auto it = s_.bankTransactions.rbegin(); it != s_.bankTransactions.rend(); ++it) {
            const auto& t = it->second;
            if (t.tenantId == tenantId && t.userId == userId && t.assetId == assetId) {
                result.push_back(t);
                if (static_cast<int>(result.size()) >= limit) break;
            }
        }
        return result;
    }

    domain::Amount totalBankDeposits(const domain::TenantId& tenantId, domain::AssetId assetId) override {
        domain::Amount total;
        for (const auto& [key, acc] : s_.bankAccounts) {
            if (acc.tenantId == tenantId && acc.assetId == assetId) total += acc.balance;
        }
        return total;
    }

    // ========================================================================
    // AUTO REWARDS
    // ========================================================================

    int64_t upsertRewardConfig(const domain::AutoRewardConfig& config) override {
        auto existing = findRewardConfigByChannel(config.tenantId, config.channelId);
        domain::AutoRewardConfig stored = config;
        stored.id = existing ? existing->id : s_.nextId++;
        s_.rewardConfigs[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::AutoRewardConfig> findRewardConfig(int64_t id) override {
        auto it = s_.rewardConfigs.find(id);
        if (it == s_.rewardConfigs.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::AutoRewardConfig> findRewardConfigByChannel(const domain::TenantId& tenantId,
                                                                      const std::string& channelId) override {
        for (const auto& [id, c] : s_.rewardConfigs) {
            if (c.tenantId == tenantId && c.channelId == channelId) return c;
        }
        return std::nullopt;
    }

    std::vector<domain::AutoRewardConfig> listRewardConfigs(const domain::TenantId& tenantId) override {
        std::vector<domain::AutoRewardConfig> result;
        for (const auto& [id, c] : s_.rewardConfigs) {
            if (c.tenantId == tenantId) result.push_back(c);
        }
        return result;
    }

    bool setRewardConfigEnabled(int64_t id, bool enabled) override {
        auto it = s_.rewardConfigs.find(id);
        if (it == s_.rewardConfigs.end()) return false;
        it->second.enabled = enabled;
        return true;
    }

    bool deleteRewardConfig(int64_t id) override {
        eraseIf(s_.rewardClaims, [&](const domain::AutoRewardClaim& c) { return c.configId == id; });
        return s_.rewardConfigs.erase(id) > 0;
    }

    bool insertRewardClaim(const domain::AutoRewardClaim& claim) override {
        for (const auto& [id, c] : s_.rewardClaims) {
            if (c.configId == claim.configId && c.userId == claim.userId) return false;
        }
        domain::AutoRewardClaim stored = claim;
        stored.id = s_.nextId++;
        s_.rewardClaims[stored.id] = stored;
        return true;
    }

    int64_t countRewardClaims(int64_t configId) override {
        return std::count_if(s_.rewardClaims.begin(), s_.rewardClaims.end(),
                             [&](const auto& kv) { return kv.second.configId == configId; });
    }

    // ========================================================================
    // ROLE SHOP
    // ========================================================================

    int64_t insertPanel(const domain::RolePanel& panel) override {
        domain::RolePanel stored = panel;
        stored.id = s_.nextId++;
        s_.panels[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::RolePanel> findPanel(int64_t id) override {
        auto it = s_.panels.find(id);
        if (it == s_.panels.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::RolePanel> listPanels(const domain::TenantId& tenantId) override {
        std::vector<domain::RolePanel> result;
        for (const auto& [id, p] : s_.panels) {
            if (p.tenantId == tenantId) result.push_back(p);
        }
        return result;
    }

    bool deletePanel(int64_t id) override {
        eraseIf(s_.plans, [&](const domain::RolePlan& p) { return p.panelId == id; });
        return s_.panels.erase(id) > 0;
    }

    int64_t insertPlan(const domain::RolePlan& plan) override {
        domain::RolePlan stored = plan;
        stored.id = s_.nextId++;
        s_.plans[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::RolePlan> findPlan(int64_t id) override {
        auto it = s_.plans.find(id);
        if (it == s_.plans.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::RolePlan> listPlans(int64_t panelId) override {
        std::vector<domain::RolePlan> result;
        for (const auto& [id, p] : s_.plans) {
            if (p.panelId == panelId) result.push_back(p);
        }
        return result;
    }

    bool deletePlan(int64_t id) override {
        return s_.plans.erase(id) > 0;
    }

    int64_t insertPurchase(const domain::RolePurchase& purchase) override {
        domain::RolePurchase stored = purchase;
        stored.id = s_.nextId++;
        s_.purchases[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::RolePurchase> findPurchase(int64_t id) override {
        auto it = s_.purchases.find(id);
        if (it == s_.purchases.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::RolePurchase> listPurchases(const domain::TenantId& tenantId,
                                                    const domain::UserId& userId) override {
        std::vector<domain::RolePurchase> result;
        for (const auto& [id, p] : s_.purchases) {
            if (p.tenantId == tenantId && p.userId == userId) result.push_back(p);
        }
        return result;
    }

    std::vector<domain::RolePurchase> findExpiredPurchases(const domain::Timestamp& now, int limit) override {
        std::vector<domain::RolePurchase> result;
        for (const auto& [id, p] : s_.purchases) {
            if (p.isExpired(now)) {
                result.push_back(p);
                if (static_cast<int>(result.size()) >= limit) break;
            }
        }
        return result;
    }

    bool hasOtherActivePurchase(const domain::RolePurchase& purchase, const domain::Timestamp& now) override {
        return std::any_of(s_.purchases.begin(), s_.purchases.end(), [&](const auto& kv) {
            const auto& p = kv.second;
            return p.id != purchase.id && p.tenantId == purchase.tenantId &&
                   p.userId == purchase.userId && p.roleId == purchase.roleId && !p.isExpired(now);
        });
    }

    bool deletePurchase(int64_t id) override {
        return s_.purchases.erase(id) > 0;
    }

    // ========================================================================
    // MONTHLY ALLOWANCE
    // ========================================================================

    int64_t upsertAllowanceConfig(const domain::AllowanceConfig& config) override {
        for (auto& [id, c] : s_.allowanceConfigs) {
            if (c.tenantId == config.tenantId && c.roleId == config.roleId && c.assetId == config.assetId) {
                domain::AllowanceConfig stored = config;
                stored.id = id;
                c = stored;
                return id;
            }
        }
        domain::AllowanceConfig stored = config;
        stored.id = s_.nextId++;
        s_.allowanceConfigs[stored.id] = stored;
        return stored.id;
    }

    std::vector<domain::AllowanceConfig> listAllowanceConfigs(const domain::TenantId& tenantId) override {
        std::vector<domain::AllowanceConfig> result;
        for (const auto& [id, c] : s_.allowanceConfigs) {
            if (c.tenantId == tenantId) result.push_back(c);
        }
        return result;
    }

    std::vector<domain::AllowanceConfig> listEnabledAllowanceConfigs() override {
        std::vector<domain::AllowanceConfig> result;
        for (const auto& [id, c] : s_.allowanceConfigs) {
            if (c.enabled) result.push_back(c);
        }
        return result;
    }

    bool deleteAllowanceConfig(int64_t id) override {
        return s_.allowanceConfigs.erase(id) > 0;
    }

    bool hasAllowanceRecord(const domain::TenantId& tenantId,
                            const std::string& roleId,
                            const domain::UserId& userId,
                            domain::AssetId assetId,
                            const std::string& yearMonth) override {
        return std::any_of(s_.allowanceRecords.begin(), s_.allowanceRecords.end(), [&](const auto& kv) {
            const auto& r = kv.second;
            return r.tenantId == tenantId && r.roleId == roleId && r.userId == userId &&
                   r.assetId == assetId && r.yearMonth == yearMonth;
        });
    }

    bool insertAllowanceRecord(const domain::AllowanceRecord& record) override {
        if (hasAllowanceRecord(record.tenantId, record.roleId, record.userId, record.assetId, record.yearMonth)) {
            return false;
        }
        domain::AllowanceRecord stored = record;
        stored.id = s_.nextId++;
        s_.allowanceRecords[stored.id] = stored;
        return true;
    }

    std::vector<domain::AllowanceRecord> listAllowanceRecords(const domain::TenantId& tenantId,
                                                              const std::string& yearMonth) override {
        std::vector<domain::AllowanceRecord> result;
        for (const auto& [id, r] : s_.allowanceRecords) {
            if (r.tenantId == tenantId && r.yearMonth == yearMonth) result.push_back(r);
        }
        return result;
    }

    // ========================================================================
    // VC EARNING
    // ========================================================================

    void upsertVcRate(const domain::VcEarningRate& rate) override {
        for (auto& [id, r] : s_.vcRates) {
            if (r.tenantId == rate.tenantId && r.categoryId == rate.categoryId) {
                domain::VcEarningRate stored = rate;
                stored.id = id;
                r = stored;
                return;
            }
        }
        domain::VcEarningRate stored = rate;
        stored.id = s_.nextId++;
        s_.vcRates[stored.id] = stored;
    }

    std::optional<domain::VcEarningRate> findVcRate(const domain::TenantId& tenantId,
                                                    const std::string& categoryId) override {
        for (const auto& [id, r] : s_.vcRates) {
            if (r.tenantId == tenantId && r.categoryId == categoryId) return r;
        }
        return std::nullopt;
    }

    std::vector<domain::VcEarningRate> listVcRates(const domain::TenantId& tenantId) override {
        std::vector<domain::VcEarningRate> result;
        for (const auto& [id, r] : s_.vcRates) {
            if (r.tenantId == tenantId) result.push_back(r);
        }
        return result;
    }

    bool deleteVcRate(const domain::TenantId& tenantId, const std::string& categoryId) override {
        return eraseIf(s_.vcRates, [&](const domain::VcEarningRate& r) {
            return r.tenantId == tenantId && r.categoryId == categoryId;
        }) > 0;
    }

    void upsertVcSession(const domain::VcSession& session) override {
        s_.vcSessions[{session.tenantId, session.userId}] = session;
    }

    std::optional<domain::VcSession> findVcSession(const domain::TenantId& tenantId,
                                                   const domain::UserId& userId) override {
        auto it = s_.vcSessions.find({tenantId, userId});
        if (it == s_.vcSessions.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::VcSession> listVcSessions() override {
        std::vector<domain::VcSession> result;
        for (const auto& [key, session] : s_.vcSessions) result.push_back(session);
        return result;
    }

    bool deleteVcSession(const domain::TenantId& tenantId, const domain::UserId& userId) override {
        return s_.vcSessions.erase({tenantId, userId}) > 0;
    }

    int64_t clearVcSessions() override {
        auto count = static_cast<int64_t>(s_.vcSessions.size());
        s_.vcSessions.clear();
        return count;
    }

    void addVcDaily(const domain::VcDailyTotal& delta) override {
        auto key = std::make_tuple(delta.tenantId, delta.userId, delta.assetId, delta.date);
        auto it = s_.vcDaily.find(key);
        if (it == s_.vcDaily.end()) {
            s_.vcDaily[key] = delta;
        } else {
            it->second.total += delta.total;
        }
    }

    std::vector<domain::VcDailyTotal> listVcDaily(const domain::TenantId& tenantId,
                                                  const domain::UserId& userId,
                                                  const std::string& date) override {
        std::vector<domain::VcDailyTotal> result;
        for (const auto& [key, d] : s_.vcDaily) {
            if (d.tenantId == tenantId && d.userId == userId && d.date == date) result.push_back(d);
        }
        return result;
    }

    int64_t purgeVcDailyBefore(const std::string& cutoffDate) override {
        int64_t removed = 0;
        for (auto it = s_.vcDaily.begin(); it != s_.vcDaily.end();) {
            if (it->second.date < cutoffDate) { it = s_.vcDaily.erase(it); ++removed; }
            else ++it;
        }
        return removed;
    }

    // ========================================================================
    // BETTING
    // ========================================================================

    int64_t insertBettingEvent(const domain::BettingEvent& event) override {
        domain::BettingEvent stored = event;
        stored.id = s_.nextId++;
        s_.bettingEvents[stored.id] = stored;
        return stored.id;
    }

    std::optional<domain::BettingEvent> findActiveBettingEvent(const domain::TenantId& tenantId) override {
        for (const auto& [id, e] : s_.bettingEvents) {
            if (e.tenantId == tenantId && e.active) return e;
        }
        return std::nullopt;
    }

    void closeBettingEvent(int64_t eventId, const std::optional<domain::UserId>& winnerId) override {
        auto it = s_.bettingEvents.find(eventId);
        if (it != s_.bettingEvents.end()) {
            it->second.active = false;
            it->second.winnerId = winnerId;
        }
    }

    bool addBettingPlayer(int64_t eventId, const domain::UserId& userId) override {
        return s_.bettingPlayers.insert({eventId, userId}).second;
    }

    bool removeBettingPlayer(int64_t eventId, const domain::UserId& userId) override {
        return s_.bettingPlayers.erase({eventId, userId}) > 0;
    }

    std::vector<domain::UserId> listBettingPlayers(int64_t eventId) override {
        std::vector<domain::UserId> result;
        for (const auto& [id, user] : s_.bettingPlayers) {
            if (id == eventId) result.push_back(user);
        }
        return result;
    }

    int64_t insertBet(const domain::Bet& bet) override {
        domain::Bet stored = bet;
        stored.id = s_.nextId++;
        s_.bets[stored.id] = stored;
        return stored.id;
    }

    std::vector<domain::Bet> listBets(int64_t eventId) override {
        std::vector<domain::Bet> result;
        for (const auto& [id, b] : s_.bets) {
            if (b.eventId == eventId) result.push_back(b);
        }
        return result;
    }

private:
    InMemoryStorage& storage_;
    std::unique_lock<std::mutex> lock_;
    InMemoryStorage::State s_;
    bool committed_ = false;

    template <typename Map, typename Pred>
    static int64_t eraseIf(Map& map, Pred pred) {
        int64_t removed = 0;
        for (auto it = map.begin(); it != map.end();) {
            if (pred(it->second)) { it = map.erase(it); ++removed; }
            else ++it;
        }
        return removed;
    }

    void eraseTransaction(domain::TransactionId txId) {
        auto it = s_.transactions.find(txId);
        if (it == s_.transactions.end()) return;
        if (it->second.header.idempotencyKey) {
            s_.transactionsByKey.erase({it->second.header.kind, *it->second.header.idempotencyKey});
        }
        s_.transactions.erase(it);
    }

    std::map<std::pair<domain::AccountId, domain::AssetId>, domain::Amount> replay() const {
        std::map<std::pair<domain::AccountId, domain::AssetId>, domain::Amount> result;
        for (const auto& [id, e] : s_.entries) {
            result[{e.accountId, e.assetId}] += e.amount;
        }
        return result;
    }
};

inline std::unique_ptr<ports::output::IStorageSession> InMemoryStorage::begin() {
    return std::make_unique<InMemorySession>(*this);
}

} // namespace ledger::adapters::secondary
