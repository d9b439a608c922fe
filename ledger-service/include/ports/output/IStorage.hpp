#pragma once

#include "domain/Account.hpp"
#include "domain/Asset.hpp"
#include "domain/AutoReward.hpp"
#include "domain/Balance.hpp"
#include "domain/Bank.hpp"
#include "domain/Betting.hpp"
#include "domain/MonthlyAllowance.hpp"
#include "domain/RoleShop.hpp"
#include "domain/Transaction.hpp"
#include "domain/VcEarning.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Таблица assets
 */
class IAssetStore {
public:
    virtual ~IAssetStore() = default;

    /// @return nullopt, если (tenant, symbol) уже существует
    virtual std::optional<domain::AssetId> insertAsset(const domain::Asset& asset) = 0;
    virtual std::optional<domain::Asset> findAssetBySymbol(const domain::TenantId& tenantId,
                                                           const std::string& symbol) = 0;
    virtual std::optional<domain::Asset> findAssetById(domain::AssetId id) = 0;
    virtual std::vector<domain::Asset> listAssets(const domain::TenantId& tenantId) = 0;

    /// Удалить актив и все ссылающиеся на него строки
    virtual domain::AssetDeletionReport deleteAssetCascade(domain::AssetId id) = 0;
};

/**
 * @brief Таблица accounts
 */
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    /// INSERT ... ON CONFLICT (name) DO NOTHING
    virtual void insertAccountIgnore(const domain::Account& account) = 0;
    virtual std::optional<domain::Account> findAccountByName(const std::string& name) = 0;
    virtual std::optional<domain::Account> findAccountById(domain::AccountId id) = 0;

    /// Блокировка строки счёта до конца сессии (SELECT ... FOR UPDATE)
    virtual void lockAccount(domain::AccountId id) = 0;
};

/**
 * @brief Таблицы transactions, ledger_entries, account_balances
 *
 * account_balances - производный индекс, обновляется в той же сессии,
 * что и вставка проводки.
 */
class IJournalStore {
public:
    virtual ~IJournalStore() = default;

    /// @return nullopt, если (kind, idempotencyKey) уже занят
    virtual std::optional<domain::TransactionId> insertTransaction(const domain::TransactionHeader& header,
                                                                   const domain::Timestamp& createdAt) = 0;
    virtual std::optional<domain::Transaction> findTransaction(domain::TransactionId id) = 0;
    virtual std::optional<domain::Transaction> findTransactionByKey(const std::string& kind,
                                                                    const std::string& idempotencyKey) = 0;
    virtual std::vector<domain::Transaction> listTransactions(const domain::TenantId& tenantId,
                                                              const std::string& kind) = 0;

    virtual domain::EntryId insertEntry(const domain::LedgerEntry& entry) = 0;
    virtual std::vector<domain::LedgerEntry> entriesFor(domain::TransactionId txId) = 0;

    /// Баланс из account_balances (ноль, если строки нет)
    virtual domain::Amount cachedBalance(domain::AccountId accountId, domain::AssetId assetId) = 0;

    /// Точная сумма проводок
    virtual domain::Amount sumEntries(domain::AccountId accountId, domain::AssetId assetId) = 0;

    /// Пересобрать account_balances из проводок; @return число строк
    virtual int64_t rebuildBalances() = 0;
    virtual std::vector<domain::BalanceMismatch> findBalanceMismatches() = 0;
};

class IBankStore {
public:
    virtual ~IBankStore() = default;

    virtual std::optional<domain::BankAccount> findBankAccount(const domain::TenantId& tenantId,
                                                               const domain::UserId& userId,
                                                               domain::AssetId assetId) = 0;
    virtual void saveBankAccount(const domain::BankAccount& account) = 0;
    virtual int64_t insertBankTransaction(const domain::BankTransaction& tx) = 0;
    virtual std::vector<domain::BankTransaction> listBankTransactions(const domain::TenantId& tenantId,
                                                                      const domain::UserId& userId,
                                                                      domain::AssetId assetId,
                                                                      int limit) = 0;
    virtual domain::Amount totalBankDeposits(const domain::TenantId& tenantId, domain::AssetId assetId) = 0;
};

class IAutoRewardStore {
public:
    virtual ~IAutoRewardStore() = default;

    /// Upsert по (tenant, channel); @return id конфигурации
    virtual int64_t upsertRewardConfig(const domain::AutoRewardConfig& config) = 0;
    virtual std::optional<domain::AutoRewardConfig> findRewardConfig(int64_t id) = 0;
    virtual std::optional<domain::AutoRewardConfig> findRewardConfigByChannel(const domain::TenantId& tenantId,
                                                                              const std::string& channelId) = 0;
    virtual std::vector<domain::AutoRewardConfig> listRewardConfigs(const domain::TenantId& tenantId) = 0;
    virtual bool setRewardConfigEnabled(int64_t id, bool enabled) = 0;
    virtual bool deleteRewardConfig(int64_t id) = 0;

    /// @return false, если (config, user) уже есть
    virtual bool insertRewardClaim(const domain::AutoRewardClaim& claim) = 0;
    virtual int64_t countRewardClaims(int64_t configId) = 0;
};

class IRoleShopStore {
public:
    virtual ~IRoleShopStore() = default;

    virtual int64_t insertPanel(const domain::RolePanel& panel) = 0;
    virtual std::optional<domain::RolePanel> findPanel(int64_t id) = 0;
    virtual std::vector<domain::RolePanel> listPanels(const domain::TenantId& tenantId) = 0;
    virtual bool deletePanel(int64_t id) = 0;

    virtual int64_t insertPlan(const domain::RolePlan& plan) = 0;
    virtual std::optional<domain::RolePlan> findPlan(int64_t id) = 0;
    virtual std::vector<domain::RolePlan> listPlans(int64_t panelId) = 0;
    virtual bool deletePlan(int64_t id) = 0;

    virtual int64_t insertPurchase(const domain::RolePurchase& purchase) = 0;
    virtual std::optional<domain::RolePurchase> findPurchase(int64_t id) = 0;
    virtual std::vector<domain::RolePurchase> listPurchases(const domain::TenantId& tenantId,
                                                            const domain::UserId& userId) = 0;
    virtual std::vector<domain::RolePurchase> findExpiredPurchases(const domain::Timestamp& now, int limit) = 0;
    virtual bool hasOtherActivePurchase(const domain::RolePurchase& purchase, const domain::Timestamp& now) = 0;
    virtual bool deletePurchase(int64_t id) = 0;
};

class IAllowanceStore {
public:
    virtual ~IAllowanceStore() = default;

    /// Upsert по (tenant, role, asset)
    virtual int64_t upsertAllowanceConfig(const domain::AllowanceConfig& config) = 0;
    virtual std::vector<domain::AllowanceConfig> listAllowanceConfigs(const domain::TenantId& tenantId) = 0;
    virtual std::vector<domain::AllowanceConfig> listEnabledAllowanceConfigs() = 0;
    virtual bool deleteAllowanceConfig(int64_t id) = 0;

    virtual bool hasAllowanceRecord(const domain::TenantId& tenantId,
                                    const std::string& roleId,
                                    const domain::UserId& userId,
                                    domain::AssetId assetId,
                                    const std::string& yearMonth) = 0;
    /// @return false, если запись за период уже есть
    virtual bool insertAllowanceRecord(const domain::AllowanceRecord& record) = 0;
    virtual std::vector<domain::AllowanceRecord> listAllowanceRecords(const domain::TenantId& tenantId,
                                                                      const std::string& yearMonth) = 0;
};

class IVcStore {
public:
    virtual ~IVcStore() = default;

    virtual void upsertVcRate(const domain::VcEarningRate& rate) = 0;
    virtual std::optional<domain::VcEarningRate> findVcRate(const domain::TenantId& tenantId,
                                                            const std::string& categoryId) = 0;
    virtual std::vector<domain::VcEarningRate> listVcRates(const domain::TenantId& tenantId) = 0;
    virtual bool deleteVcRate(const domain::TenantId& tenantId, const std::string& categoryId) = 0;

    virtual void upsertVcSession(const domain::VcSession& session) = 0;
    virtual std::optional<domain::VcSession> findVcSession(const domain::TenantId& tenantId,
                                                           const domain::UserId& userId) = 0;
    virtual std::vector<domain::VcSession> listVcSessions() = 0;
    virtual bool deleteVcSession(const domain::TenantId& tenantId, const domain::UserId& userId) = 0;
    virtual int64_t clearVcSessions() = 0;

    virtual void addVcDaily(const domain::VcDailyTotal& delta) = 0;
    virtual std::vector<domain::VcDailyTotal> listVcDaily(const domain::TenantId& tenantId,
                                                          const domain::UserId& userId,
                                                          const std::string& date) = 0;
    /// Удалить итоги с date < cutoffDate; @return число строк
    virtual int64_t purgeVcDailyBefore(const std::string& cutoffDate) = 0;
};

class IBettingStore {
public:
    virtual ~IBettingStore() = default;

    virtual int64_t insertBettingEvent(const domain::BettingEvent& event) = 0;
    virtual std::optional<domain::BettingEvent> findActiveBettingEvent(const domain::TenantId& tenantId) = 0;
    virtual void closeBettingEvent(int64_t eventId, const std::optional<domain::UserId>& winnerId) = 0;

    virtual bool addBettingPlayer(int64_t eventId, const domain::UserId& userId) = 0;
    virtual bool removeBettingPlayer(int64_t eventId, const domain::UserId& userId) = 0;
    virtual std::vector<domain::UserId> listBettingPlayers(int64_t eventId) = 0;

    virtual int64_t insertBet(const domain::Bet& bet) = 0;
    virtual std::vector<domain::Bet> listBets(int64_t eventId) = 0;
};

/**
 * @brief Одна атомарная единица работы
 *
 * Всё, что записано через сессию, фиксируется вызовом commit().
 * Деструктор без commit() откатывает изменения.
 * Адаптер бросает StorageConflict при конфликте изоляции.
 */
class IStorageSession {
public:
    virtual ~IStorageSession() = default;

    virtual IAssetStore& assets() = 0;
    virtual IAccountStore& accounts() = 0;
    virtual IJournalStore& journal() = 0;
    virtual IBankStore& bank() = 0;
    virtual IAutoRewardStore& rewards() = 0;
    virtual IRoleShopStore& roles() = 0;
    virtual IAllowanceStore& allowances() = 0;
    virtual IVcStore& voice() = 0;
    virtual IBettingStore& betting() = 0;

    virtual void commit() = 0;
};

/**
 * @brief Общее хранилище (PostgreSQL или память)
 */
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::unique_ptr<IStorageSession> begin() = 0;
};

} // namespace ledger::ports::output
