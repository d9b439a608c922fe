#pragma once

namespace ledger::adapters::secondary {

/**
 * @brief DDL журнала и вспомогательных таблиц
 *
 * Суммы - NUMERIC (точная десятичная), передаются и читаются текстом.
 * account_balances - производный индекс, пересобирается из ledger_entries.
 */
inline constexpr const char* kLedgerSchema = R"(
    CREATE TABLE IF NOT EXISTS assets (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        symbol TEXT NOT NULL,
        name TEXT NOT NULL,
        decimals INTEGER NOT NULL CHECK (decimals BETWEEN 0 AND 8),
        UNIQUE (tenant_id, symbol)
    );

    CREATE TABLE IF NOT EXISTS accounts (
        id BIGSERIAL PRIMARY KEY,
        owner_id TEXT,
        tenant_id TEXT NOT NULL,
        name TEXT NOT NULL UNIQUE,
        type TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS transactions (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        kind TEXT NOT NULL,
        created_by TEXT,
        idempotency_key TEXT,
        reference TEXT,
        created_at TIMESTAMPTZ NOT NULL
    );
    CREATE UNIQUE INDEX IF NOT EXISTS idx_transactions_idempotency
        ON transactions (kind, idempotency_key) WHERE idempotency_key IS NOT NULL;
    CREATE INDEX IF NOT EXISTS idx_transactions_tenant_kind ON transactions (tenant_id, kind);

    CREATE TABLE IF NOT EXISTS ledger_entries (
        id BIGSERIAL PRIMARY KEY,
        transaction_id BIGINT NOT NULL REFERENCES transactions(id),
        account_id BIGINT NOT NULL REFERENCES accounts(id),
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        amount NUMERIC NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_ledger_entries_account_asset ON ledger_entries (account_id, asset_id);
    CREATE INDEX IF NOT EXISTS idx_ledger_entries_transaction ON ledger_entries (transaction_id);

    CREATE TABLE IF NOT EXISTS account_balances (
        account_id BIGINT NOT NULL REFERENCES accounts(id),
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        balance NUMERIC NOT NULL DEFAULT 0,
        PRIMARY KEY (account_id, asset_id)
    );

    CREATE TABLE IF NOT EXISTS bank_accounts (
        tenant_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        balance NUMERIC NOT NULL DEFAULT 0,
        updated_at TIMESTAMPTZ NOT NULL,
        PRIMARY KEY (tenant_id, user_id, asset_id)
    );

    CREATE TABLE IF NOT EXISTS bank_transactions (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        operation TEXT NOT NULL,
        amount NUMERIC NOT NULL,
        balance_after NUMERIC NOT NULL,
        transaction_id BIGINT NOT NULL,
        created_at TIMESTAMPTZ NOT NULL
    );

    CREATE TABLE IF NOT EXISTS auto_reward_configs (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        channel_id TEXT NOT NULL,
        trigger_phrase TEXT NOT NULL,
        reward_amount NUMERIC NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        enabled BOOLEAN NOT NULL DEFAULT TRUE,
        created_at TIMESTAMPTZ NOT NULL,
        UNIQUE (tenant_id, channel_id)
    );

    CREATE TABLE IF NOT EXISTS auto_reward_claims (
        id BIGSERIAL PRIMARY KEY,
        config_id BIGINT NOT NULL REFERENCES auto_reward_configs(id),
        user_id TEXT NOT NULL,
        transaction_id BIGINT NOT NULL,
        claimed_at TIMESTAMPTZ NOT NULL,
        UNIQUE (config_id, user_id)
    );

    CREATE TABLE IF NOT EXISTS role_panels (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        name TEXT NOT NULL,
        description TEXT NOT NULL DEFAULT ''
    );

    CREATE TABLE IF NOT EXISTS role_plans (
        id BIGSERIAL PRIMARY KEY,
        panel_id BIGINT NOT NULL REFERENCES role_panels(id),
        tenant_id TEXT NOT NULL,
        name TEXT NOT NULL,
        role_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        price NUMERIC NOT NULL,
        duration_hours INTEGER NOT NULL,
        description TEXT NOT NULL DEFAULT ''
    );

    CREATE TABLE IF NOT EXISTS role_purchases (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        plan_id BIGINT NOT NULL,
        role_id TEXT NOT NULL,
        transaction_id BIGINT NOT NULL REFERENCES transactions(id),
        purchased_at TIMESTAMPTZ NOT NULL,
        expires_at TIMESTAMPTZ NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_role_purchases_expires ON role_purchases (expires_at);

    CREATE TABLE IF NOT EXISTS allowance_configs (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        role_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        amount NUMERIC NOT NULL,
        enabled BOOLEAN NOT NULL DEFAULT TRUE,
        UNIQUE (tenant_id, role_id, asset_id)
    );

    CREATE TABLE IF NOT EXISTS allowance_records (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        role_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        year_month TEXT NOT NULL,
        amount NUMERIC NOT NULL,
        transaction_id BIGINT NOT NULL,
        paid_at TIMESTAMPTZ NOT NULL,
        UNIQUE (tenant_id, role_id, user_id, asset_id, year_month)
    );

    CREATE TABLE IF NOT EXISTS vc_earning_rates (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        category_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        rate_per_minute NUMERIC NOT NULL,
        UNIQUE (tenant_id, category_id)
    );

    CREATE TABLE IF NOT EXISTS vc_sessions (
        tenant_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        channel_id TEXT NOT NULL,
        category_id TEXT NOT NULL,
        started_at TIMESTAMPTZ NOT NULL,
        PRIMARY KEY (tenant_id, user_id)
    );

    CREATE TABLE IF NOT EXISTS vc_earning_daily (
        tenant_id TEXT NOT NULL,
        user_id TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        earn_date TEXT NOT NULL,
        total NUMERIC NOT NULL DEFAULT 0,
        PRIMARY KEY (tenant_id, user_id, asset_id, earn_date)
    );

    CREATE TABLE IF NOT EXISTS betting_events (
        id BIGSERIAL PRIMARY KEY,
        tenant_id TEXT NOT NULL,
        title TEXT NOT NULL,
        asset_id BIGINT NOT NULL REFERENCES assets(id),
        active BOOLEAN NOT NULL DEFAULT TRUE,
        winner_id TEXT,
        created_at TIMESTAMPTZ NOT NULL
    );
    CREATE UNIQUE INDEX IF NOT EXISTS idx_betting_events_one_active
        ON betting_events (tenant_id) WHERE active;

    CREATE TABLE IF NOT EXISTS betting_players (
        event_id BIGINT NOT NULL REFERENCES betting_events(id),
        user_id TEXT NOT NULL,
        PRIMARY KEY (event_id, user_id)
    );

    CREATE TABLE IF NOT EXISTS bets (
        id BIGSERIAL PRIMARY KEY,
        event_id BIGINT NOT NULL REFERENCES betting_events(id),
        bettor_id TEXT NOT NULL,
        target_id TEXT NOT NULL,
        stake NUMERIC NOT NULL,
        transaction_id BIGINT NOT NULL
    );
)";

} // namespace ledger::adapters::secondary
