// include/adapters/secondary/persistence/PostgresStorage.hpp
#pragma once

#include "ports/output/IStorage.hpp"
#include "settings/DbSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include "PostgresSchema.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Сессия PostgreSQL: одно соединение, одна SERIALIZABLE транзакция
 *
 * Ошибки сериализации и дедлоки (pqxx::transaction_rollback)
 * превращаются в StorageConflict - LedgerService повторит единицу работы.
 */
class PostgresSession : public ports::output::IStorageSession,
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
    using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

    explicit PostgresSession(const std::string& connectionString)
        : conn_(std::make_unique<pqxx::connection>(connectionString))
        , txn_(std::make_unique<SerializableWork>(*conn_))
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
        try {
            txn_->commit();
        } catch (const pqxx::transaction_rollback& e) {
            throw domain::StorageConflict(e.what());
        }
    }

    // ========================================================================
    // ASSETS
    // ========================================================================

    std::optional<domain::AssetId> insertAsset(const domain::Asset& asset) override {
        auto result = run(
            "INSERT INTO assets (tenant_id, symbol, name, decimals) VALUES ($1, $2, $3, $4) "
            "ON CONFLICT (tenant_id, symbol) DO NOTHING RETURNING id",
            asset.tenantId, asset.symbol, asset.name, asset.decimals);
        if (result.empty()) return std::nullopt;
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::Asset> findAssetBySymbol(const domain::TenantId& tenantId,
                                                   const std::string& symbol) override {
        auto result = run(
            "SELECT id, tenant_id, symbol, name, decimals FROM assets WHERE tenant_id = $1 AND symbol = $2",
            tenantId, symbol);
        if (result.empty()) return std::nullopt;
        return rowToAsset(result[0]);
    }

    std::optional<domain::Asset> findAssetById(domain::AssetId id) override {
        auto result = run("SELECT id, tenant_id, symbol, name, decimals FROM assets WHERE id = $1", id);
        if (result.empty()) return std::nullopt;
        return rowToAsset(result[0]);
    }

    std::vector<domain::Asset> listAssets(const domain::TenantId& tenantId) override {
        auto result = run(
            "SELECT id, tenant_id, symbol, name, decimals FROM assets WHERE tenant_id = $1 ORDER BY symbol",
            tenantId);
        std::vector<domain::Asset> assets;
        for (const auto& row : result) assets.push_back(rowToAsset(row));
        return assets;
    }

    domain::AssetDeletionReport deleteAssetCascade(domain::AssetId id) override {
        domain::AssetDeletionReport r;
        r.assetId = id;

        r.rewardClaims = run(
            "DELETE FROM auto_reward_claims WHERE config_id IN "
            "(SELECT id FROM auto_reward_configs WHERE asset_id = $1)", id).affected_rows();
        r.rewardConfigs = run("DELETE FROM auto_reward_configs WHERE asset_id = $1", id).affected_rows();
        r.bankTransactions = run("DELETE FROM bank_transactions WHERE asset_id = $1", id).affected_rows();
        r.bankAccounts = run("DELETE FROM bank_accounts WHERE asset_id = $1", id).affected_rows();
        r.rolePurchases = run(
            "DELETE FROM role_purchases WHERE plan_id IN (SELECT id FROM role_plans WHERE asset_id = $1) "
            "OR transaction_id IN (SELECT transaction_id FROM ledger_entries WHERE asset_id = $1)",
            id).affected_rows();
        r.rolePlans = run("DELETE FROM role_plans WHERE asset_id = $1", id).affected_rows();
        r.allowanceRecords = run("DELETE FROM allowance_records WHERE asset_id = $1", id).affected_rows();
        r.allowanceConfigs = run("DELETE FROM allowance_configs WHERE asset_id = $1", id).affected_rows();
        r.vcDailyTotals = run("DELETE FROM vc_earning_daily WHERE asset_id = $1", id).affected_rows();
        r.vcRates = run("DELETE FROM vc_earning_rates WHERE asset_id = $1", id).affected_rows();
        run("DELETE FROM bets WHERE event_id IN (SELECT id FROM betting_events WHERE asset_id = $1)", id);
        run("DELETE FROM betting_players WHERE event_id IN (SELECT id FROM betting_events WHERE asset_id = $1)", id);
        r.bettingEvents = run("DELETE FROM betting_events WHERE asset_id = $1", id).affected_rows();
        r.balanceRows = run("DELETE FROM account_balances WHERE asset_id = $1", id).affected_rows();

        // Все подзапросы CTE видят один снимок, поэтому "пустая" транзакция -
        // та, у которой нет проводок по другим активам
        auto counts = run(R"(
            WITH removed AS (
                DELETE FROM ledger_entries WHERE asset_id = $1 RETURNING transaction_id
            ), orphaned AS (
                DELETE FROM transactions t
                WHERE t.id IN (SELECT transaction_id FROM removed)
                  AND NOT EXISTS (SELECT 1 FROM ledger_entries e
                                  WHERE e.transaction_id = t.id AND e.asset_id <> $1)
                RETURNING t.id
            )
            SELECT (SELECT COUNT(*) FROM removed) AS entries,
                   (SELECT COUNT(*) FROM orphaned) AS transactions
        )", id);
        r.ledgerEntries = counts[0]["entries"].as<int64_t>();
        r.transactions = counts[0]["transactions"].as<int64_t>();

        run("DELETE FROM assets WHERE id = $1", id);
        return r;
    }

    // ========================================================================
    // ACCOUNTS
    // ========================================================================

    void insertAccountIgnore(const domain::Account& account) override {
        run("INSERT INTO accounts (owner_id, tenant_id, name, type) VALUES ($1, $2, $3, $4) "
            "ON CONFLICT (name) DO NOTHING",
            account.ownerId, account.tenantId, account.name, domain::toString(account.type));
    }

    std::optional<domain::Account> findAccountByName(const std::string& name) override {
        auto result = run("SELECT id, owner_id, tenant_id, name, type FROM accounts WHERE name = $1", name);
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::optional<domain::Account> findAccountById(domain::AccountId id) override {
        auto result = run("SELECT id, owner_id, tenant_id, name, type FROM accounts WHERE id = $1", id);
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    void lockAccount(domain::AccountId id) override {
        run("SELECT id FROM accounts WHERE id = $1 FOR UPDATE", id);
    }

    // ========================================================================
    // JOURNAL
    // ========================================================================

    std::optional<domain::TransactionId> insertTransaction(const domain::TransactionHeader& header,
                                                           const domain::Timestamp& createdAt) override {
        auto result = run(
            "INSERT INTO transactions (tenant_id, kind, created_by, idempotency_key, reference, created_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6)) "
            "ON CONFLICT (kind, idempotency_key) WHERE idempotency_key IS NOT NULL DO NOTHING "
            "RETURNING id",
            header.tenantId, header.kind, header.creatorId, header.idempotencyKey, header.reference,
            createdAt.epochSeconds());
        if (result.empty()) return std::nullopt;
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::Transaction> findTransaction(domain::TransactionId id) override {
        auto result = run(kSelectTransaction + std::string(" WHERE id = $1"), id);
        if (result.empty()) return std::nullopt;
        return rowToTransaction(result[0]);
    }

    std::optional<domain::Transaction> findTransactionByKey(const std::string& kind,
                                                            const std::string& idempotencyKey) override {
        auto result = run(kSelectTransaction + std::string(" WHERE kind = $1 AND idempotency_key = $2"),
                          kind, idempotencyKey);
        if (result.empty()) return std::nullopt;
        return rowToTransaction(result[0]);
    }

    std::vector<domain::Transaction> listTransactions(const domain::TenantId& tenantId,
                                                      const std::string& kind) override {
        auto result = run(kSelectTransaction + std::string(" WHERE tenant_id = $1 AND kind = $2 ORDER BY id"),
                          tenantId, kind);
        std::vector<domain::Transaction> txs;
        for (const auto& row : result) txs.push_back(rowToTransaction(row));
        return txs;
    }

    domain::EntryId insertEntry(const domain::LedgerEntry& entry) override {
        auto result = run(
            "INSERT INTO ledger_entries (transaction_id, account_id, asset_id, amount) "
            "VALUES ($1, $2, $3, $4::numeric) RETURNING id",
            entry.transactionId, entry.accountId, entry.assetId, entry.amount.toString());
        run("INSERT INTO account_balances (account_id, asset_id, balance) VALUES ($1, $2, $3::numeric) "
            "ON CONFLICT (account_id, asset_id) DO UPDATE "
            "SET balance = account_balances.balance + EXCLUDED.balance",
            entry.accountId, entry.assetId, entry.amount.toString());
        return result[0]["id"].as<int64_t>();
    }

    std::vector<domain::LedgerEntry> entriesFor(domain::TransactionId txId) override {
        auto result = run(
            "SELECT id, transaction_id, account_id, asset_id, amount::text AS amount "
            "FROM ledger_entries WHERE transaction_id = $1 ORDER BY id", txId);
        std::vector<domain::LedgerEntry> entries;
        for (const auto& row : result) {
            domain::LedgerEntry e;
            e.id = row["id"].as<int64_t>();
            e.transactionId = row["transaction_id"].as<int64_t>();
            e.accountId = row["account_id"].as<int64_t>();
            e.assetId = row["asset_id"].as<int64_t>();
            e.amount = amountOf(row["amount"]);
            entries.push_back(e);
        }
        return entries;
    }

    domain::Amount cachedBalance(domain::AccountId accountId, domain::AssetId assetId) override {
        auto result = run(
            "SELECT balance::text AS balance FROM account_balances WHERE account_id = $1 AND asset_id = $2",
            accountId, assetId);
        if (result.empty()) return domain::Amount();
        return amountOf(result[0]["balance"]);
    }

    domain::Amount sumEntries(domain::AccountId accountId, domain::AssetId assetId) override {
        auto result = run(
            "SELECT COALESCE(SUM(amount), 0)::text AS total FROM ledger_entries "
            "WHERE account_id = $1 AND asset_id = $2",
            accountId, assetId);
        return amountOf(result[0]["total"]);
    }

    int64_t rebuildBalances() override {
        run("DELETE FROM account_balances");
        return run(
            "INSERT INTO account_balances (account_id, asset_id, balance) "
            "SELECT account_id, asset_id, SUM(amount) FROM ledger_entries GROUP BY account_id, asset_id")
            .affected_rows();
    }

    std::vector<domain::BalanceMismatch> findBalanceMismatches() override {
        auto result = run(R"(
            WITH replayed AS (
                SELECT account_id, asset_id, SUM(amount) AS total
                FROM ledger_entries GROUP BY account_id, asset_id
            )
            SELECT COALESCE(b.account_id, r.account_id) AS account_id,
                   COALESCE(b.asset_id, r.asset_id) AS asset_id,
                   COALESCE(b.balance, 0)::text AS cached,
                   COALESCE(r.total, 0)::text AS replayed
            FROM account_balances b
            FULL OUTER JOIN replayed r
              ON b.account_id = r.account_id AND b.asset_id = r.asset_id
            WHERE COALESCE(b.balance, 0) <> COALESCE(r.total, 0)
        )");
        std::vector<domain::BalanceMismatch> mismatches;
        for (const auto& row : result) {
            mismatches.push_back({row["account_id"].as<int64_t>(), row["asset_id"].as<int64_t>(),
                                  amountOf(row["cached"]), amountOf(row["replayed"])});
        }
        return mismatches;
    }

    // ========================================================================
    // BANK
    // ========================================================================

    std::optional<domain::BankAccount> findBankAccount(const domain::TenantId& tenantId,
                                                       const domain::UserId& userId,
                                                       domain::AssetId assetId) override {
        auto result = run(
            "SELECT tenant_id, user_id, asset_id, balance::text AS balance, "
            "EXTRACT(EPOCH FROM updated_at)::bigint AS updated_at "
            "FROM bank_accounts WHERE tenant_id = $1 AND user_id = $2 AND asset_id = $3",
            tenantId, userId, assetId);
        if (result.empty()) return std::nullopt;
        domain::BankAccount account;
        account.tenantId = result[0]["tenant_id"].as<std::string>();
        account.userId = result[0]["user_id"].as<std::string>();
        account.assetId = result[0]["asset_id"].as<int64_t>();
        account.balance = amountOf(result[0]["balance"]);
        account.updatedAt = timeOf(result[0]["updated_at"]);
        return account;
    }

    void saveBankAccount(const domain::BankAccount& account) override {
        run("INSERT INTO bank_accounts (tenant_id, user_id, asset_id, balance, updated_at) "
            "VALUES ($1, $2, $3, $4::numeric, to_timestamp($5)) "
            "ON CONFLICT (tenant_id, user_id, asset_id) DO UPDATE SET "
            "balance = EXCLUDED.balance, updated_at = EXCLUDED.updated_at",
            account.tenantId, account.userId, account.assetId, account.balance.toString(),
            account.updatedAt.epochSeconds());
    }

    int64_t insertBankTransaction(const domain::BankTransaction& tx) override {
        auto result = run(
            "INSERT INTO bank_transactions (tenant_id, user_id, asset_id, operation, amount, balance_after, "
            "transaction_id, created_at) VALUES ($1, $2, $3, $4, $5::numeric, $6::numeric, $7, to_timestamp($8)) "
            "RETURNING id",
            tx.tenantId, tx.userId, tx.assetId, domain::toString(tx.operation), tx.amount.toString(),
            tx.balanceAfter.toString(), tx.transactionId, tx.createdAt.epochSeconds());
        return result[0]["id"].as<int64_t>();
    }

    std::vector<domain::BankTransaction> listBankTransactions(const domain::TenantId& tenantId,
                                                              const domain::UserId& userId,
                                                              domain::AssetId assetId,
                                                              int limit) override {
        auto result = run(
            "SELECT id, tenant_id, user_id, asset_id, operation, amount::text AS amount, "
            "balance_after::text AS balance_after, transaction_id, "
            "EXTRACT(EPOCH FROM created_at)::bigint AS created_at "
            "FROM bank_transactions WHERE tenant_id = $1 AND user_id = $2 AND asset_id = $3 "
            "ORDER BY id DESC LIMIT $4",
            tenantId, userId, assetId, limit);
        std::vector<domain::BankTransaction> history;
        for (const auto& row : result) {
            domain::BankTransaction t;
            t.id = row["id"].as<int64_t>();
            t.tenantId = row["tenant_id"].as<std::string>();
            t.userId = row["user_id"].as<std::string>();
            t.assetId = row["asset_id"].as<int64_t>();
            t.operation = domain::parseBankOperation(row["operation"].as<std::string>());
            t.amount = amountOf(row["amount"]);
            t.balanceAfter = amountOf(row["balance_after"]);
            t.transactionId = row["transaction_id"].as<int64_t>();
            t.createdAt = timeOf(row["created_at"]);
            history.push_back(t);
        }
        return history;
    }

    domain::Amount totalBankDeposits(const domain::TenantId& tenantId, domain::AssetId assetId) override {
        auto result = run(
            "SELECT COALESCE(SUM(balance), 0)::text AS total FROM bank_accounts "
            "WHERE tenant_id = $1 AND asset_id = $2",
            tenantId, assetId);
        return amountOf(result[0]["total"]);
    }

    // ========================================================================
    // AUTO REWARDS
    // ========================================================================

    int64_t upsertRewardConfig(const domain::AutoRewardConfig& config) override {
        auto result = run(
            "INSERT INTO auto_reward_configs (tenant_id, channel_id, trigger_phrase, reward_amount, asset_id, "
            "enabled, created_at) VALUES ($1, $2, $3, $4::numeric, $5, $6, to_timestamp($7)) "
            "ON CONFLICT (tenant_id, channel_id) DO UPDATE SET "
            "trigger_phrase = EXCLUDED.trigger_phrase, reward_amount = EXCLUDED.reward_amount, "
            "asset_id = EXCLUDED.asset_id, enabled = EXCLUDED.enabled "
            "RETURNING id",
            config.tenantId, config.channelId, config.triggerPhrase, config.rewardAmount.toString(),
            config.assetId, config.enabled, config.createdAt.epochSeconds());
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::AutoRewardConfig> findRewardConfig(int64_t id) override {
        auto result = run(kSelectRewardConfig + std::string(" WHERE id = $1"), id);
        if (result.empty()) return std::nullopt;
        return rowToRewardConfig(result[0]);
    }

    std::optional<domain::AutoRewardConfig> findRewardConfigByChannel(const domain::TenantId& tenantId,
                                                                      const std::string& channelId) override {
        auto result = run(kSelectRewardConfig + std::string(" WHERE tenant_id = $1 AND channel_id = $2"),
                          tenantId, channelId);
        if (result.empty()) return std::nullopt;
        return rowToRewardConfig(result[0]);
    }

    std::vector<domain::AutoRewardConfig> listRewardConfigs(const domain::TenantId& tenantId) override {
        auto result = run(kSelectRewardConfig + std::string(" WHERE tenant_id = $1 ORDER BY id"), tenantId);
        std::vector<domain::AutoRewardConfig> configs;
        for (const auto& row : result) configs.push_back(rowToRewardConfig(row));
        return configs;
    }

    bool setRewardConfigEnabled(int64_t id, bool enabled) override {
        return run("UPDATE auto_reward_configs SET enabled = $2 WHERE id = $1", id, enabled).affected_rows() > 0;
    }

    bool deleteRewardConfig(int64_t id) override {
        run("DELETE FROM auto_reward_claims WHERE config_id = $1", id);
        return run("DELETE FROM auto_reward_configs WHERE id = $1", id).affected_rows() > 0;
    }

    bool insertRewardClaim(const domain::AutoRewardClaim& claim) override {
        auto result = run(
            "INSERT INTO auto_reward_claims (config_id, user_id, transaction_id, claimed_at) "
            "VALUES ($1, $2, $3, to_timestamp($4)) ON CONFLICT (config_id, user_id) DO NOTHING RETURNING id",
            claim.configId, claim.userId, claim.transactionId, claim.claimedAt.epochSeconds());
        return !result.empty();
    }

    int64_t countRewardClaims(int64_t configId) override {
        auto result = run("SELECT COUNT(*) AS n FROM auto_reward_claims WHERE config_id = $1", configId);
        return result[0]["n"].as<int64_t>();
    }

    // ========================================================================
    // ROLE SHOP
    // ========================================================================

    int64_t insertPanel(const domain::RolePanel& panel) override {
        auto result = run(
            "INSERT INTO role_panels (tenant_id, name, description) VALUES ($1, $2, $3) RETURNING id",
            panel.tenantId, panel.name, panel.description);
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::RolePanel> findPanel(int64_t id) override {
        auto result = run("SELECT id, tenant_id, name, description FROM role_panels WHERE id = $1", id);
        if (result.empty()) return std::nullopt;
        return rowToPanel(result[0]);
    }

    std::vector<domain::RolePanel> listPanels(const domain::TenantId& tenantId) override {
        auto result = run(
            "SELECT id, tenant_id, name, description FROM role_panels WHERE tenant_id = $1 ORDER BY id",
            tenantId);
        std::vector<domain::RolePanel> panels;
        for (const auto& row : result) panels.push_back(rowToPanel(row));
        return panels;
    }

    bool deletePanel(int64_t id) override {
        run("DELETE FROM role_plans WHERE panel_id = $1", id);
        return run("DELETE FROM role_panels WHERE id = $1", id).affected_rows() > 0;
    }

    int64_t insertPlan(const domain::RolePlan& plan) override {
        auto result = run(
            "INSERT INTO role_plans (panel_id, tenant_id, name, role_id, asset_id, price, duration_hours, "
            "description) VALUES ($1, $2, $3, $4, $5, $6::numeric, $7, $8) RETURNING id",
            plan.panelId, plan.tenantId, plan.name, plan.roleId, plan.assetId, plan.price.toString(),
            plan.durationHours, plan.description);
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::RolePlan> findPlan(int64_t id) override {
        auto result = run(kSelectPlan + std::string(" WHERE id = $1"), id);
        if (result.empty()) return std::nullopt;
        return rowToPlan(result[0]);
    }

    std::vector<domain::RolePlan> listPlans(int64_t panelId) override {
        auto result = run(kSelectPlan + std::string(" WHERE panel_id = $1 ORDER BY id"), panelId);
        std::vector<domain::RolePlan> plans;
        for (const auto& row : result) plans.push_back(rowToPlan(row));
        return plans;
    }

    bool deletePlan(int64_t id) override {
        return run("DELETE FROM role_plans WHERE id = $1", id).affected_rows() > 0;
    }

    int64_t insertPurchase(const domain::RolePurchase& purchase) override {
        auto result = run(
            "INSERT INTO role_purchases (tenant_id, user_id, plan_id, role_id, transaction_id, purchased_at, "
            "expires_at) VALUES ($1, $2, $3, $4, $5, to_timestamp($6), to_timestamp($7)) RETURNING id",
            purchase.tenantId, purchase.userId, purchase.planId, purchase.roleId, purchase.transactionId,
            purchase.purchasedAt.epochSeconds(), purchase.expiresAt.epochSeconds());
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::RolePurchase> findPurchase(int64_t id) override {
        auto result = run(kSelectPurchase + std::string(" WHERE id = $1"), id);
        if (result.empty()) return std::nullopt;
        return rowToPurchase(result[0]);
    }

    std::vector<domain::RolePurchase> listPurchases(const domain::TenantId& tenantId,
                                                    const domain::UserId& userId) override {
        auto result = run(kSelectPurchase + std::string(" WHERE tenant_id = $1 AND user_id = $2 ORDER BY id"),
                          tenantId, userId);
        std::vector<domain::RolePurchase> purchases;
        for (const auto& row : result) purchases.push_back(rowToPurchase(row));
        return purchases;
    }

    std::vector<domain::RolePurchase> findExpiredPurchases(const domain::Timestamp& now, int limit) override {
        auto result = run(kSelectPurchase + std::string(" WHERE expires_at <= to_timestamp($1) "
                                                        "ORDER BY expires_at LIMIT $2"),
                          now.epochSeconds(), limit);
        std::vector<domain::RolePurchase> purchases;
        for (const auto& row : result) purchases.push_back(rowToPurchase(row));
        return purchases;
    }

    bool hasOtherActivePurchase(const domain::RolePurchase& purchase, const domain::Timestamp& now) override {
        auto result = run(
            "SELECT 1 FROM role_purchases WHERE tenant_id = $1 AND user_id = $2 AND role_id = $3 "
            "AND id <> $4 AND expires_at > to_timestamp($5) LIMIT 1",
            purchase.tenantId, purchase.userId, purchase.roleId, purchase.id, now.epochSeconds());
        return !result.empty();
    }

    bool deletePurchase(int64_t id) override {
        return run("DELETE FROM role_purchases WHERE id = $1", id).affected_rows() > 0;
    }

    // ========================================================================
    // MONTHLY ALLOWANCE
    // ========================================================================

    int64_t upsertAllowanceConfig(const domain::AllowanceConfig& config) override {
        auto result = run(
            "INSERT INTO allowance_configs (tenant_id, role_id, asset_id, amount, enabled) "
            "VALUES ($1, $2, $3, $4::numeric, $5) "
            "ON CONFLICT (tenant_id, role_id, asset_id) DO UPDATE SET "
            "amount = EXCLUDED.amount, enabled = EXCLUDED.enabled RETURNING id",
            config.tenantId, config.roleId, config.assetId, config.amount.toString(), config.enabled);
        return result[0]["id"].as<int64_t>();
    }

    std::vector<domain::AllowanceConfig> listAllowanceConfigs(const domain::TenantId& tenantId) override {
        auto result = run(kSelectAllowanceConfig + std::string(" WHERE tenant_id = $1 ORDER BY id"), tenantId);
        std::vector<domain::AllowanceConfig> configs;
        for (const auto& row : result) configs.push_back(rowToAllowanceConfig(row));
        return configs;
    }

    std::vector<domain::AllowanceConfig> listEnabledAllowanceConfigs() override {
        auto result = run(kSelectAllowanceConfig + std::string(" WHERE enabled ORDER BY id"));
        std::vector<domain::AllowanceConfig> configs;
        for (const auto& row : result) configs.push_back(rowToAllowanceConfig(row));
        return configs;
    }

    bool deleteAllowanceConfig(int64_t id) override {
        return run("DELETE FROM allowance_configs WHERE id = $1", id).affected_rows() > 0;
    }

    bool hasAllowanceRecord(const domain::TenantId& tenantId,
                            const std::string& roleId,
                            const domain::UserId& userId,
                            domain::AssetId assetId,
                            const std::string& yearMonth) override {
        auto result = run(
            "SELECT 1 FROM allowance_records WHERE tenant_id = $1 AND role_id = $2 AND user_id = $3 "
            "AND asset_id = $4 AND year_month = $5",
            tenantId, roleId, userId, assetId, yearMonth);
        return !result.empty();
    }

    bool insertAllowanceRecord(const domain::AllowanceRecord& record) override {
        auto result = run(
            "INSERT INTO allowance_records (tenant_id, role_id, user_id, asset_id, year_month, amount, "
            "transaction_id, paid_at) VALUES ($1, $2, $3, $4, $5, $6::numeric, $7, to_timestamp($8)) "
            "ON CONFLICT (tenant_id, role_id, user_id, asset_id, year_month) DO NOTHING RETURNING id",
            record.tenantId, record.roleId, record.userId, record.assetId, record.yearMonth,
            record.amount.toString(), record.transactionId, record.paidAt.epochSeconds());
        return !result.empty();
    }

    std::vector<domain::AllowanceRecord> listAllowanceRecords(const domain::TenantId& tenantId,
                                                              const std::string& yearMonth) override {
        auto result = run(
            "SELECT id, tenant_id, role_id, user_id, asset_id, year_month, amount::text AS amount, "
            "transaction_id, EXTRACT(EPOCH FROM paid_at)::bigint AS paid_at "
            "FROM allowance_records WHERE tenant_id = $1 AND year_month = $2 ORDER BY id",
            tenantId, yearMonth);
        std::vector<domain::AllowanceRecord> records;
        for (const auto& row : result) {
            domain::AllowanceRecord r;
            r.id = row["id"].as<int64_t>();
            r.tenantId = row["tenant_id"].as<std::string>();
            r.roleId = row["role_id"].as<std::string>();
            r.userId = row["user_id"].as<std::string>();
            r.assetId = row["asset_id"].as<int64_t>();
            r.yearMonth = row["year_month"].as<std::string>();
            r.amount = amountOf(row["amount"]);
            r.transactionId = row["transaction_id"].as<int64_t>();
            r.paidAt = timeOf(row["paid_at"]);
            records.push_back(r);
        }
        return records;
    }

    // ========================================================================
    // VC EARNING
    // ========================================================================

    void upsertVcRate(const domain::VcEarningRate& rate) override {
        run("INSERT INTO vc_earning_rates (tenant_id, category_id, asset_id, rate_per_minute) "
            "VALUES ($1, $2, $3, $4::numeric) ON CONFLICT (tenant_id, category_id) DO UPDATE SET "
            "asset_id = EXCLUDED.asset_id, rate_per_minute = EXCLUDED.rate_per_minute",
            rate.tenantId, rate.categoryId, rate.assetId, rate.ratePerMinute.toString());
    }

    std::optional<domain::VcEarningRate> findVcRate(const domain::TenantId& tenantId,
                                                    const std::string& categoryId) override {
        auto result = run(kSelectVcRate + std::string(" WHERE tenant_id = $1 AND category_id = $2"),
                          tenantId, categoryId);
        if (result.empty()) return std::nullopt;
        return rowToVcRate(result[0]);
    }

    std::vector<domain::VcEarningRate> listVcRates(const domain::TenantId& tenantId) override {
        auto result = run(kSelectVcRate + std::string(" WHERE tenant_id = $1 ORDER BY id"), tenantId);
        std::vector<domain::VcEarningRate> rates;
        for (const auto& row : result) rates.push_back(rowToVcRate(row));
        return rates;
    }

    bool deleteVcRate(const domain::TenantId& tenantId, const std::string& categoryId) override {
        return run("DELETE FROM vc_earning_rates WHERE tenant_id = $1 AND category_id = $2",
                   tenantId, categoryId).affected_rows() > 0;
    }

    void upsertVcSession(const domain::VcSession& session) override {
        run("INSERT INTO vc_sessions (tenant_id, user_id, channel_id, category_id, started_at) "
            "VALUES ($1, $2, $3, $4, to_timestamp($5)) ON CONFLICT (tenant_id, user_id) DO UPDATE SET "
            "channel_id = EXCLUDED.channel_id, category_id = EXCLUDED.category_id, "
            "started_at = EXCLUDED.started_at",
            session.tenantId, session.userId, session.channelId, session.categoryId,
            session.startedAt.epochSeconds());
    }

    std::optional<domain::VcSession> findVcSession(const domain::TenantId& tenantId,
                                                   const domain::UserId& userId) override {
        auto result = run(kSelectVcSession + std::string(" WHERE tenant_id = $1 AND user_id = $2"),
                          tenantId, userId);
        if (result.empty()) return std::nullopt;
        return rowToVcSession(result[0]);
    }

    std::vector<domain::VcSession> listVcSessions() override {
        auto result = run(kSelectVcSession + std::string(" ORDER BY tenant_id, user_id"));
        std::vector<domain::VcSession> sessions;
        for (const auto& row : result) sessions.push_back(rowToVcSession(row));
        return sessions;
    }

    bool deleteVcSession(const domain::TenantId& tenantId, const domain::UserId& userId) override {
        return run("DELETE FROM vc_sessions WHERE tenant_id = $1 AND user_id = $2",
                   tenantId, userId).affected_rows() > 0;
    }

    int64_t clearVcSessions() override {
        return run("DELETE FROM vc_sessions").affected_rows();
    }

    void addVcDaily(const domain::VcDailyTotal& delta) override {
        run("INSERT INTO vc_earning_daily (tenant_id, user_id, asset_id, earn_date, total) "
            "VALUES ($1, $2, $3, $4, $5::numeric) "
            "ON CONFLICT (tenant_id, user_id, asset_id, earn_date) DO UPDATE "
            "SET total = vc_earning_daily.total + EXCLUDED.total",
            delta.tenantId, delta.userId, delta.assetId, delta.date, delta.total.toString());
    }

    std::vector<domain::VcDailyTotal> listVcDaily(const domain::TenantId& tenantId,
                                                  const domain::UserId& userId,
                                                  const std::string& date) override {
        auto result = run(
            "SELECT tenant_id, user_id, asset_id, earn_date, total::text AS total FROM vc_earning_daily "
            "WHERE tenant_id = $1 AND user_id = $2 AND earn_date = $3 ORDER BY asset_id",
            tenantId, userId, date);
        std::vector<domain::VcDailyTotal> totals;
        for (const auto& row : result) {
            domain::VcDailyTotal d;
            d.tenantId = row["tenant_id"].as<std::string>();
            d.userId = row["user_id"].as<std::string>();
            d.assetId = row["asset_id"].as<int64_t>();
            d.date = row["earn_date"].as<std::string>();
            d.total = amountOf(row["total"]);
            totals.push_back(d);
        }
        return totals;
    }

    int64_t purgeVcDailyBefore(const std::string& cutoffDate) override {
        // YYYY-MM-DD сравнивается лексикографически
        return run("DELETE FROM vc_earning_daily WHERE earn_date < $1", cutoffDate).affected_rows();
    }

    // ========================================================================
    // BETTING
    // ========================================================================

    int64_t insertBettingEvent(const domain::BettingEvent& event) override {
        auto result = run(
            "INSERT INTO betting_events (tenant_id, title, asset_id, active, created_at) "
            "VALUES ($1, $2, $3, TRUE, to_timestamp($4)) RETURNING id",
            event.tenantId, event.title, event.assetId, event.createdAt.epochSeconds());
        return result[0]["id"].as<int64_t>();
    }

    std::optional<domain::BettingEvent> findActiveBettingEvent(const domain::TenantId& tenantId) override {
        auto result = run(
            "SELECT id, tenant_id, title, asset_id, active, winner_id, "
            "EXTRACT(EPOCH FROM created_at)::bigint AS created_at "
            "FROM betting_events WHERE tenant_id = $1 AND active",
            tenantId);
        if (result.empty()) return std::nullopt;
        const auto& row = result[0];
        domain::BettingEvent e;
        e.id = row["id"].as<int64_t>();
        e.tenantId = row["tenant_id"].as<std::string>();
        e.title = row["title"].as<std::string>();
        e.assetId = row["asset_id"].as<int64_t>();
        e.active = row["active"].as<bool>();
        if (!row["winner_id"].is_null()) e.winnerId = row["winner_id"].as<std::string>();
        e.createdAt = timeOf(row["created_at"]);
        return e;
    }

    void closeBettingEvent(int64_t eventId, const std::optional<domain::UserId>& winnerId) override {
        run("UPDATE betting_events SET active = FALSE, winner_id = $2 WHERE id = $1", eventId, winnerId);
    }

    bool addBettingPlayer(int64_t eventId, const domain::UserId& userId) override {
        return run("INSERT INTO betting_players (event_id, user_id) VALUES ($1, $2) "
                   "ON CONFLICT DO NOTHING", eventId, userId).affected_rows() > 0;
    }

    bool removeBettingPlayer(int64_t eventId, const domain::UserId& userId) override {
        return run("DELETE FROM betting_players WHERE event_id = $1 AND user_id = $2",
                   eventId, userId).affected_rows() > 0;
    }

    std::vector<domain::UserId> listBettingPlayers(int64_t eventId) override {
        auto result = run("SELECT user_id FROM betting_players WHERE event_id = $1 ORDER BY user_id", eventId);
        std::vector<domain::UserId> players;
        for (const auto& row : result) players.push_back(row["user_id"].as<std::string>());
        return players;
    }

    int64_t insertBet(const domain::Bet& bet) override {
        auto result = run(
            "INSERT INTO bets (event_id, bettor_id, target_id, stake, transaction_id) "
            "VALUES ($1, $2, $3, $4::numeric, $5) RETURNING id",
            bet.eventId, bet.bettorId, bet.targetId, bet.stake.toString(), bet.transactionId);
        return result[0]["id"].as<int64_t>();
    }

    std::vector<domain::Bet> listBets(int64_t eventId) override {
        auto result = run(
            "SELECT id, event_id, bettor_id, target_id, stake::text AS stake, transaction_id "
            "FROM bets WHERE event_id = $1 ORDER BY id", eventId);
        std::vector<domain::Bet> bets;
        for (const auto& row : result) {
            domain::Bet b;
            b.id = row["id"].as<int64_t>();
            b.eventId = row["event_id"].as<int64_t>();
            b.bettorId = row["bettor_id"].as<std::string>();
            b.targetId = row["target_id"].as<std::string>();
            b.stake = amountOf(row["stake"]);
            b.transactionId = row["transaction_id"].as<int64_t>();
            bets.push_back(b);
        }
        return bets;
    }

private:
    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<SerializableWork> txn_;

    static constexpr const char* kSelectTransaction =
        "SELECT id, tenant_id, kind, created_by, idempotency_key, reference, "
        "EXTRACT(EPOCH FROM created_at)::bigint AS created_at FROM transactions";
    static constexpr const char* kSelectRewardConfig =
        "SELECT id, tenant_id, channel_id, trigger_phrase, reward_amount::text AS reward_amount, asset_id, "
        "enabled, EXTRACT(EPOCH FROM created_at)::bigint AS created_at FROM auto_reward_configs";
    static constexpr const char* kSelectPlan =
        "SELECT id, panel_id, tenant_id, name, role_id, asset_id, price::text AS price, duration_hours, "
        "description FROM role_plans";
    static constexpr const char* kSelectPurchase =
        "SELECT id, tenant_id, user_id, plan_id, role_id, transaction_id, "
        "EXTRACT(EPOCH FROM purchased_at)::bigint AS purchased_at, "
        "EXTRACT(EPOCH FROM expires_at)::bigint AS expires_at FROM role_purchases";
    static constexpr const char* kSelectAllowanceConfig =
        "SELECT id, tenant_id, role_id, asset_id, amount::text AS amount, enabled FROM allowance_configs";
    static constexpr const char* kSelectVcRate =
        "SELECT id, tenant_id, category_id, asset_id, rate_per_minute::text AS rate_per_minute "
        "FROM vc_earning_rates";
    static constexpr const char* kSelectVcSession =
        "SELECT tenant_id, user_id, channel_id, category_id, "
        "EXTRACT(EPOCH FROM started_at)::bigint AS started_at FROM vc_sessions";

    template <typename... Args>
    pqxx::result run(const std::string& sql, Args&&... args) {
        try {
            return txn_->exec_params(sql, std::forward<Args>(args)...);
        } catch (const pqxx::transaction_rollback& e) {
            throw domain::StorageConflict(e.what());
        }
    }

    static domain::Amount amountOf(const pqxx::field& field) {
        return domain::Amount::parse(field.as<std::string>());
    }

    static domain::Timestamp timeOf(const pqxx::field& field) {
        return domain::Timestamp::fromEpochSeconds(field.as<int64_t>());
    }

    static domain::Asset rowToAsset(const pqxx::row& row) {
        domain::Asset a;
        a.id = row["id"].as<int64_t>();
        a.tenantId = row["tenant_id"].as<std::string>();
        a.symbol = row["symbol"].as<std::string>();
        a.name = row["name"].as<std::string>();
        a.decimals = row["decimals"].as<int>();
        return a;
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account a;
        a.id = row["id"].as<int64_t>();
        if (!row["owner_id"].is_null()) a.ownerId = row["owner_id"].as<std::string>();
        a.tenantId = row["tenant_id"].as<std::string>();
        a.name = row["name"].as<std::string>();
        a.type = domain::parseAccountType(row["type"].as<std::string>());
        return a;
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::Transaction tx;
        tx.id = row["id"].as<int64_t>();
        tx.header.tenantId = row["tenant_id"].as<std::string>();
        tx.header.kind = row["kind"].as<std::string>();
        if (!row["created_by"].is_null()) tx.header.creatorId = row["created_by"].as<std::string>();
        if (!row["idempotency_key"].is_null()) tx.header.idempotencyKey = row["idempotency_key"].as<std::string>();
        if (!row["reference"].is_null()) tx.header.reference = row["reference"].as<std::string>();
        tx.createdAt = timeOf(row["created_at"]);
        return tx;
    }

    static domain::AutoRewardConfig rowToRewardConfig(const pqxx::row& row) {
        domain::AutoRewardConfig c;
        c.id = row["id"].as<int64_t>();
        c.tenantId = row["tenant_id"].as<std::string>();
        c.channelId = row["channel_id"].as<std::string>();
        c.triggerPhrase = row["trigger_phrase"].as<std::string>();
        c.rewardAmount = amountOf(row["reward_amount"]);
        c.assetId = row["asset_id"].as<int64_t>();
        c.enabled = row["enabled"].as<bool>();
        c.createdAt = timeOf(row["created_at"]);
        return c;
    }

    static domain::RolePanel rowToPanel(const pqxx::row& row) {
        domain::RolePanel p;
        p.id = row["id"].as<int64_t>();
        p.tenantId = row["tenant_id"].as<std::string>();
        p.name = row["name"].as<std::string>();
        p.description = row["description"].as<std::string>();
        return p;
    }

    static domain::RolePlan rowToPlan(const pqxx::row& row) {
        domain::RolePlan p;
        p.id = row["id"].as<int64_t>();
        p.panelId = row["panel_id"].as<int64_t>();
        p.tenantId = row["tenant_id"].as<std::string>();
        p.name = row["name"].as<std::string>();
        p.roleId = row["role_id"].as<std::string>();
        p.assetId = row["asset_id"].as<int64_t>();
        p.price = amountOf(row["price"]);
        p.durationHours = row["duration_hours"].as<int>();
        p.description = row["description"].as<std::string>();
        return p;
    }

    static domain::RolePurchase rowToPurchase(const pqxx::row& row) {
        domain::RolePurchase p;
        p.id = row["id"].as<int64_t>();
        p.tenantId = row["tenant_id"].as<std::string>();
        p.userId = row["user_id"].as<std::string>();
        p.planId = row["plan_id"].as<int64_t>();
        p.roleId = row["role_id"].as<std::string>();
        p.transactionId = row["transaction_id"].as<int64_t>();
        p.purchasedAt = timeOf(row["purchased_at"]);
        p.expiresAt = timeOf(row["expires_at"]);
        return p;
    }

    static domain::AllowanceConfig rowToAllowanceConfig(const pqxx::row& row) {
        domain::AllowanceConfig c;
        c.id = row["id"].as<int64_t>();
        c.tenantId = row["tenant_id"].as<std::string>();
        c.roleId = row["role_id"].as<std::string>();
        c.assetId = row["asset_id"].as<int64_t>();
        c.amount = amountOf(row["amount"]);
        c.enabled = row["enabled"].as<bool>();
        return c;
    }

    static domain::VcEarningRate rowToVcRate(const pqxx::row& row) {
        domain::VcEarningRate r;
        r.id = row["id"].as<int64_t>();
        r.tenantId = row["tenant_id"].as<std::string>();
        r.categoryId = row["category_id"].as<std::string>();
        r.assetId = row["asset_id"].as<int64_t>();
        r.ratePerMinute = amountOf(row["rate_per_minute"]);
        return r;
    }

    static domain::VcSession rowToVcSession(const pqxx::row& row) {
        domain::VcSession s;
        s.tenantId = row["tenant_id"].as<std::string>();
        s.userId = row["user_id"].as<std::string>();
        s.channelId = row["channel_id"].as<std::string>();
        s.categoryId = row["category_id"].as<std::string>();
        s.startedAt = timeOf(row["started_at"]);
        return s;
    }
};

/**
 * @brief PostgreSQL реализация хранилища
 *
 * Каждая сессия открывает своё соединение (как и остальные репозитории),
 * схема создаётся при старте.
 */
class PostgresStorage : public ports::output::IStorage {
public:
    explicit PostgresStorage(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::unique_ptr<ports::output::IStorageSession> begin() override {
        try {
            return std::make_unique<PostgresSession>(settings_->getConnectionString());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresStorage] begin() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec(kLedgerSchema);
            txn.commit();
            std::cout << "[PostgresStorage] Schema initialized on " << settings_->getHost()
                      << ":" << settings_->getPort() << "/" << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresStorage] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary
