/**
 * @file LedgerServiceTest.cpp
 * @brief Unit tests for LedgerService: balance checks, retries, treasury refill, cache rebuild
 */

#include "LedgerTestFixture.hpp"
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::tests;

class LedgerServiceTest : public LedgerTestFixture {};

// ============================================================================
// DOUBLE ENTRY
// ============================================================================

TEST_F(LedgerServiceTest, UnbalancedTransaction_ThrowsAndWritesNothing) {
    auto alice = userAccount("alice");
    auto before = storage_->snapshot();

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::TransactionHeader header;
            header.tenantId = kTenant;
            header.kind = domain::kinds::ISSUE;
            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, alice, goldId_, amt("5.00"));
        }),
        domain::UnbalancedTransaction);

    auto after = storage_->snapshot();
    EXPECT_EQ(after.transactions.size(), before.transactions.size());
    EXPECT_EQ(after.entries.size(), before.entries.size());
    EXPECT_TRUE(balanceOf("alice").isZero());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(LedgerServiceTest, BalancedTransaction_CommitsAndPublishes) {
    fund("alice", "100");

    EXPECT_EQ(balanceOf("alice"), amt("100"));
    EXPECT_TRUE(totalSupply(goldId_).isZero());

    auto committed = publisher_->messagesWithKey("transaction.committed");
    ASSERT_FALSE(committed.empty());
    auto json = nlohmann::json::parse(committed.back().message);
    EXPECT_EQ(json["kind"], "issue");
    EXPECT_EQ(json["tenantId"], kTenant);
    EXPECT_EQ(json["entries"].size(), 2u);
}

TEST_F(LedgerServiceTest, ZeroPosting_Rejected) {
    auto alice = userAccount("alice");
    auto bob = userAccount("bob");

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::TransactionHeader header;
            header.tenantId = kTenant;
            header.kind = domain::kinds::TRANSFER;
            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, alice, goldId_, domain::Amount());
            unit.postEntry(txId, bob, goldId_, domain::Amount());
        }),
        domain::InvalidAmount);
}

TEST_F(LedgerServiceTest, OverPrecisePosting_Rejected) {
    auto alice = userAccount("alice");
    auto treasury = systemAccount("treasury");

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::TransactionHeader header;
            header.tenantId = kTenant;
            header.kind = domain::kinds::ISSUE;
            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, treasury, goldId_, amt("-0.001"));
            unit.postEntry(txId, alice, goldId_, amt("0.001"));
        }),
        domain::InvalidAmount);
}

TEST_F(LedgerServiceTest, PostingAcrossTenants_Rejected) {
    accounts_->ensureSystemAccounts("guild-2");
    auto foreign = accounts_->ensureUserAccount("guild-2", "mallory");
    auto alice = userAccount("alice");

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::TransactionHeader header;
            header.tenantId = kTenant;
            header.kind = domain::kinds::TRANSFER;
            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, foreign, goldId_, amt("-1"));
            unit.postEntry(txId, alice, goldId_, amt("1"));
        }),
        domain::InvalidState);
}

TEST_F(LedgerServiceTest, PostingToForeignTransaction_Rejected) {
    auto alice = userAccount("alice");

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            unit.postEntry(424242, alice, goldId_, amt("1"));
        }),
        domain::InvalidState);
}

TEST_F(LedgerServiceTest, UserOverdraft_RejectedAtVerify) {
    auto alice = userAccount("alice");
    auto bob = userAccount("bob");

    EXPECT_THROW(
        ledger_->transact([&](ports::input::ILedgerUnit& unit) {
            domain::TransactionHeader header;
            header.tenantId = kTenant;
            header.kind = domain::kinds::TRANSFER;
            auto txId = unit.newTransaction(header);
            unit.postEntry(txId, alice, goldId_, amt("-1"));
            unit.postEntry(txId, bob, goldId_, amt("1"));
        }),
        domain::InsufficientBalance);

    EXPECT_TRUE(balanceOf("bob").isZero());
}

// ============================================================================
// RETRIES
// ============================================================================

TEST_F(LedgerServiceTest, StorageConflict_RetriedUntilCommit) {
    fund("alice", "100");
    storage_->failNextCommits(2);

    factory_->transfer(kTenant, "alice", "bob", "GOLD", amt("30"));

    EXPECT_EQ(balanceOf("alice"), amt("70"));
    EXPECT_EQ(balanceOf("bob"), amt("30"));

    auto transfers = 0;
    for (const auto& [id, tx] : storage_->snapshot().transactions) {
        if (tx.header.kind == domain::kinds::TRANSFER) ++transfers;
    }
    EXPECT_EQ(transfers, 1);
}

TEST_F(LedgerServiceTest, StorageConflict_GivesUpAfterMaxRetries) {
    fund("alice", "100");
    settings_->setMaxRetries(2);
    storage_->failNextCommits(3);
    publisher_->clearMessages();

    EXPECT_THROW(factory_->transfer(kTenant, "alice", "bob", "GOLD", amt("30")),
                 domain::StorageConflict);

    EXPECT_EQ(balanceOf("alice"), amt("100"));
    EXPECT_TRUE(balanceOf("bob").isZero());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(LedgerServiceTest, Events_PublishedOnlyAfterCommit) {
    fund("alice", "100");
    publisher_->clearMessages();
    storage_->failNextCommits(1);

    factory_->transfer(kTenant, "alice", "bob", "GOLD", amt("10"));

    // Первая попытка откатилась: ровно одно событие на одну зафиксированную транзакцию
    EXPECT_EQ(publisher_->messagesWithKey("transaction.committed").size(), 1u);
}

// ============================================================================
// TREASURY REFILL
// ============================================================================

TEST_F(LedgerServiceTest, Issue_FromEmptyTreasury_RefillsOnce) {
    fund("alice", "10");

    auto refills = publisher_->messagesWithKey("treasury.refilled");
    ASSERT_EQ(refills.size(), 1u);
    auto json = nlohmann::json::parse(refills[0].message);
    EXPECT_EQ(json["amount"], "1000");

    EXPECT_EQ(systemBalance("treasury"), amt("990"));
    EXPECT_EQ(systemBalance("mint"), amt("-1000"));
    EXPECT_TRUE(totalSupply(goldId_).isZero());
}

TEST_F(LedgerServiceTest, Issue_LargerThanQuantum_RefillsRepeatedly) {
    fund("alice", "2500");

    EXPECT_EQ(publisher_->messagesWithKey("treasury.refilled").size(), 3u);
    EXPECT_EQ(balanceOf("alice"), amt("2500"));
    EXPECT_EQ(systemBalance("treasury"), amt("500"));
}

TEST_F(LedgerServiceTest, AutoRefill_NotNeededWhenCovered) {
    fund("alice", "1");
    auto treasury = systemAccount("treasury");

    EXPECT_FALSE(ledger_->autoRefillTreasuryIfNeeded(treasury, goldId_, kTenant, amt("500")));
    EXPECT_TRUE(ledger_->autoRefillTreasuryIfNeeded(treasury, goldId_, kTenant, amt("5000")));
}

TEST_F(LedgerServiceTest, AutoRefill_RejectsNonTreasury) {
    auto alice = userAccount("alice");
    EXPECT_THROW(ledger_->autoRefillTreasuryIfNeeded(alice, goldId_, kTenant, std::nullopt),
                 domain::AccountNotFound);
}

TEST_F(LedgerServiceTest, ConcurrentIssues_SingleRefill) {
    const int threads = 8;
    const int perThread = 10;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t]() {
            for (int i = 0; i < perThread; ++i) {
                fund("user-" + std::to_string(t), "1");
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(publisher_->messagesWithKey("treasury.refilled").size(), 1u);
    EXPECT_EQ(systemBalance("treasury"), amt("920"));
    for (int t = 0; t < threads; ++t) {
        EXPECT_EQ(balanceOf("user-" + std::to_string(t)), amt("10"));
    }
    EXPECT_TRUE(totalSupply(goldId_).isZero());
}

// ============================================================================
// BALANCE CACHE
// ============================================================================

TEST_F(LedgerServiceTest, VerifyAndRebuild_RepairsCorruptedCache) {
    fund("alice", "100");
    auto alice = userAccount("alice");
    EXPECT_TRUE(ledger_->verifyBalances().empty());

    {
        auto session = storage_->begin();
        dynamic_cast<adapters::secondary::InMemorySession&>(*session)
            .overwriteCachedBalance(alice, goldId_, amt("999"));
        session->commit();
    }

    auto mismatches = ledger_->verifyBalances();
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].accountId, alice);
    EXPECT_EQ(mismatches[0].cached, amt("999"));
    EXPECT_EQ(mismatches[0].replayed, amt("100"));

    ledger_->rebuildBalances();

    EXPECT_TRUE(ledger_->verifyBalances().empty());
    EXPECT_EQ(balanceOf("alice"), amt("100"));
}

TEST_F(LedgerServiceTest, EightDecimals_CreditThenDebit_NoDrift) {
    auto satsId = assets_->createAsset(kTenant, "sats", "Satoshi", 8);
    auto alice = userAccount("alice");
    auto bob = userAccount("bob");
    factory_->issue(kTenant, std::nullopt, "alice", "SATS", amt("1.00000001"));

    for (int i = 0; i < 10; ++i) {
        factory_->transfer(kTenant, "alice", "bob", "SATS", amt("0.12345678"));
        factory_->transfer(kTenant, "bob", "alice", "SATS", amt("0.12345678"));
    }

    EXPECT_EQ(ledger_->balanceOf(alice, satsId), amt("1.00000001"));
    EXPECT_TRUE(ledger_->balanceOf(bob, satsId).isZero());
    EXPECT_TRUE(totalSupply(satsId).isZero());
}
